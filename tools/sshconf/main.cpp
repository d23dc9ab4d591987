
#include "tool_commands.hpp"

#include "sshconf/sshconf.hpp"
#include "sshconf/core/keywords.hpp"

#include <stdexcept>
#include <iostream>

using namespace sshconf;

static ssh_config load(tool_commands const& p, logger& log) {
	if(p.file.empty()) {
		log.log(logger::debug, "reading config from standard input");
		return load_config(std::cin, log);
	}
	return load_config_file(p.file, log);
}

static void print_host_config(ssh_config const& config, std::string const& host) {
	for(auto&& [key, value] : config.get_config_for_host(host)) {
		std::cout << key << " " << value << "\n";
	}
}

static void print_matching(ssh_config const& config, std::string const& host) {
	for(auto&& b : config.get_matching_hosts(host)) {
		std::cout << host_keyword << " " << b.hosts.to_string() << "\n";
	}
}

int main(int argc, char* argv[]) {
	stderr_logger log(logger::log_none);
	try {
		tool_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "sshconf - query and reformat ssh client config files\n";
			tool_commands().print_help(std::cout);
			return 0;
		}
		p.load_options_file();
		if(p.verbose) {
			log.set_level(logger::log_all);
		}

		auto config = load(p, log);
		if(p.host) {
			print_host_config(config, *p.host);
		} else if(p.list_matching) {
			print_matching(config, *p.list_matching);
		} else {
			dump_config(config, std::cout, p.make_render_options());
		}
	} catch(std::exception const& e) {
		std::cerr << "error: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
