
#include "sshconf.hpp"

#include "sshconf/common/util.hpp"
#include "sshconf/core/config_parser.hpp"

#include <fstream>

namespace sshconf {

ssh_config parse_config(std::string_view data) {
	null_logger log;
	return parse_config(data, log);
}

ssh_config parse_config(std::string_view data, logger& log) {
	return config_parser(log).parse(data);
}

ssh_config load_config(std::istream& in) {
	null_logger log;
	return load_config(in, log);
}

ssh_config load_config(std::istream& in, logger& log) {
	return parse_config(read_stream(in), log);
}

ssh_config load_config_file(std::string const& file, logger& log) {
	std::ifstream in(file, std::ios_base::binary);
	if(!in) {
		throw error("could not open config file: " + file);
	}
	tagged_logger flog(log, file + ": ");
	flog.log(logger::debug, "loading config");
	return load_config(in, flog);
}

std::string dump_config(ssh_config const& config, render_options const& opts) {
	return render(config, opts);
}

void dump_config(ssh_config const& config, std::ostream& out, render_options const& opts) {
	render(config, out, opts);
}

}
