#ifndef SSHCONF_CONFIG_PARSER_HEADER
#define SSHCONF_CONFIG_PARSER_HEADER

#include "ssh_config.hpp"

#include "sshconf/common/logger.hpp"

#include <string_view>

namespace sshconf {

/** \brief Single pass, line based parser of the client config dialect
 *
 *  Keywords before the first Host line go to an implicit "Host *" block. Within a block the
 *  first occurrence of a keyword wins, later ones are ignored. Match is not supported.
 *  Any error throws parser_error and nothing is returned.
 */
class config_parser {
public:
	config_parser(logger&);

	ssh_config parse(std::string_view data);

private:
	void reset();
	void parse_line(std::string_view line);
	void parse_host(std::string_view args);
	void parse_keyword(std::string_view line, std::string_view keyword, std::string_view value);
	void close_current();

	[[noreturn]] void fail(std::string const& message);

private:
	logger& log_;

	ssh_config config_;
	host_list current_hosts_;
	keyword_set current_values_;
	bool first_block_{true};
	bool seen_host_{};
	std::size_t line_number_{};
};

}

#endif
