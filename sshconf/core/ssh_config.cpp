
#include "ssh_config.hpp"
#include "errors.hpp"

#include <algorithm>

namespace sshconf {

void ssh_config::append(host_block b) {
	blocks_.push_back(std::move(b));
}

void ssh_config::add(host_list hosts, keyword_set keywords) {
	auto it = std::find_if(blocks_.begin(), blocks_.end(), [&](auto const& b) { return b.hosts == hosts; });
	if(it != blocks_.end()) {
		it->keywords.merge_missing(keywords);
	} else {
		blocks_.push_back(host_block{std::move(hosts), std::move(keywords)});
	}
}

std::vector<host_block> ssh_config::get_matching_hosts(std::string_view hostname) const {
	if(hostname.empty()) {
		throw invalid_argument("hostname cannot be empty");
	}
	std::vector<host_block> res;
	for(auto&& b : blocks_) {
		if(b.hosts.matches(hostname)) {
			res.push_back(b);
		}
	}
	return res;
}

keyword_set ssh_config::get_config_for_host(std::string_view hostname) const {
	keyword_set res;
	for(auto&& b : get_matching_hosts(hostname)) {
		res.merge_missing(b.keywords);
	}
	return res;
}

}
