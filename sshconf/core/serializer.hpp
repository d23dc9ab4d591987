#ifndef SSHCONF_SERIALIZER_HEADER
#define SSHCONF_SERIALIZER_HEADER

#include "ssh_config.hpp"

#include <iosfwd>
#include <string>

namespace sshconf {

struct render_options {
	// prefix of every keyword line
	std::string indent{"    "};

	// number of empty lines between two Host blocks
	std::size_t sep_lines{1};
};

/// write the config back in "Host ..." / "<indent>Keyword value" form
void render(ssh_config const&, std::ostream&, render_options const& = {});
std::string render(ssh_config const&, render_options const& = {});

}

#endif
