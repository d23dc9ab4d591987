#include "tool_commands.hpp"

namespace sshconf {

tool_commands::tool_commands() {
	add(help, "help", "h", "Show help");
	add(verbose, "verbose", "v", "Log parsing details to stderr");
	add(file, "file", "f", "Config file to read, standard input if not given");
	add(options_file, "options-file", "", "Read more options from file (may not contain --options-file)");
	add(host, "host", "H", "Print the keywords that apply to host");
	add(list_matching, "list-matching", "", "Print the Host lines of the blocks matching host");
	add(indent, "indent", "", "Number of spaces to indent keywords with");
	add(tabs, "tabs", "", "Indent keywords with a tab");
	add(sep_lines, "sep-lines", "", "Number of empty lines between Host blocks");
}

void tool_commands::load_options_file() {
	if(options_file.empty()) {
		return;
	}
	std::string file = std::move(options_file);
	options_file.clear();
	parse_file(file);
	if(!options_file.empty()) {
		throw invalid_argument("options file '" + file + "' cannot name another options file");
	}
	options_file = std::move(file);
}

render_options tool_commands::make_render_options() const {
	render_options opts;
	opts.indent = tabs ? std::string("\t") : std::string(indent, ' ');
	opts.sep_lines = sep_lines;
	return opts;
}

}
