#ifndef SSHCONF_TOOLS_SSHCONF_TOOL_COMMANDS_HEADER
#define SSHCONF_TOOLS_SSHCONF_TOOL_COMMANDS_HEADER

#include "tools/common/command_parser.hpp"
#include "sshconf/core/serializer.hpp"

#include <optional>
#include <string>

namespace sshconf {

struct tool_commands : command_parser {
	bool help{};
	bool verbose{};
	bool tabs{};
	std::string file;
	std::string options_file;
	std::optional<std::string> host;
	std::optional<std::string> list_matching;
	std::size_t indent{4};
	std::size_t sep_lines{1};

	tool_commands();

	/// parse options_file if set, an options file may not name another options file
	void load_options_file();

	render_options make_render_options() const;
};

}

#endif
