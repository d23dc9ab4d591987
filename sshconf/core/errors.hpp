#ifndef SSHCONF_ERRORS_HEADER
#define SSHCONF_ERRORS_HEADER

#include <stdexcept>
#include <string>
#include <string_view>

namespace sshconf {

/// base of everything the library throws
struct error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

/// keyword not in the keyword table, or Host/Match where a value keyword is expected
struct invalid_keyword : error {
	explicit invalid_keyword(std::string_view keyword)
	: error("Invalid keyword: " + std::string(keyword))
	, keyword_(keyword)
	{}

	std::string const& keyword() const { return keyword_; }

private:
	std::string keyword_;
};

/// malformed config text, the message carries the 1-based line number
struct parser_error : error {
	parser_error(std::string const& message, std::size_t line)
	: error(message)
	, line_(line)
	{}

	std::size_t line() const { return line_; }

private:
	std::size_t line_{};
};

/// direct lookup of a keyword that is not set
struct key_not_found : error {
	explicit key_not_found(std::string_view keyword)
	: error("Keyword not set: " + std::string(keyword))
	{}
};

/// caller passed a value the operation does not accept (empty host name, bad command line option)
struct invalid_argument : error {
	using error::error;
};

}

#endif
