
#include "serializer.hpp"
#include "keywords.hpp"

#include <ostream>
#include <sstream>

namespace sshconf {

static void render_block(host_block const& b, std::ostream& out, render_options const& opts) {
	out << host_keyword << " " << b.hosts.to_string() << "\n";
	for(auto&& [key, value] : b.keywords) {
		out << opts.indent << key << " " << value << "\n";
	}
}

void render(ssh_config const& config, std::ostream& out, render_options const& opts) {
	bool first = true;
	for(auto&& b : config) {
		if(!first) {
			for(std::size_t i = 0; i != opts.sep_lines; ++i) {
				out << "\n";
			}
		}
		first = false;
		render_block(b, out, opts);
	}
}

std::string render(ssh_config const& config, render_options const& opts) {
	std::ostringstream out;
	render(config, out, opts);
	return out.str();
}

}
