
#include "host_list.hpp"
#include "errors.hpp"

#include <fnmatch.h>

namespace sshconf {

bool host_pattern::glob_match(std::string_view hostname) const {
	// no FNM_PATHNAME/FNM_PERIOD, host names have no path semantics
	return ::fnmatch(pattern.c_str(), std::string(hostname).c_str(), 0) == 0;
}

std::string host_pattern::to_string() const {
	return negated ? "!" + pattern : pattern;
}

host_pattern parse_host_pattern(std::string_view s) {
	if(!s.empty() && s.front() == '!') {
		return host_pattern{std::string(s.substr(1)), true};
	}
	return host_pattern{std::string(s), false};
}

host_list::host_list(std::vector<std::string> const& patterns) {
	patterns_.reserve(patterns.size());
	for(auto&& p : patterns) {
		patterns_.push_back(parse_host_pattern(p));
	}
}

host_list::host_list(std::initializer_list<std::string_view> patterns) {
	patterns_.reserve(patterns.size());
	for(auto&& p : patterns) {
		patterns_.push_back(parse_host_pattern(p));
	}
}

bool host_list::matches(std::string_view hostname) const {
	if(hostname.empty()) {
		throw invalid_argument("hostname cannot be empty");
	}

	bool match_positive = false;
	bool match_negative = false;
	for(auto&& p : patterns_) {
		if(p.glob_match(hostname)) {
			if(p.negated) {
				match_negative = true;
			} else {
				match_positive = true;
			}
		}
	}
	return !match_negative && match_positive;
}

std::string host_list::to_string() const {
	std::string res;
	bool first = true;
	for(auto&& p : patterns_) {
		if(!first) {
			res += " ";
		}
		first = false;
		res += p.to_string();
	}
	return res;
}

host_list const& wildcard_host_list() {
	static host_list const list{"*"};
	return list;
}

}
