#ifndef SSHCONF_UTIL_HEADER
#define SSHCONF_UTIL_HEADER

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sshconf {

// whitespace as understood by the config dialect (space, tab, and the cr of crlf files)
inline bool is_space(char c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string to_lower(std::string_view);

bool iequals(std::string_view, std::string_view);

std::string_view trim_left(std::string_view);
std::string_view trim_right(std::string_view);
std::string_view trim(std::string_view);

/// split on runs of whitespace, empty tokens are never returned
std::vector<std::string_view> split_whitespace(std::string_view);

/// split on the first whitespace run, the second part has leading whitespace removed and is empty if there is none
std::pair<std::string_view, std::string_view> split_first_word(std::string_view);

/// split text into lines on '\n', "\r\n" and lone '\r' (like python's splitlines), no trailing empty line
std::vector<std::string_view> split_lines(std::string_view);

std::string read_stream(std::istream&);

template<typename Container>
std::ostream& print_list(std::ostream& out, Container const& c, std::string_view separator, std::string_view quote = "") {
	bool first = true;
	for(auto&& v : c) {
		if(first) {
			first = false;
			out << quote << v << quote;
		} else {
			out << separator << quote << v << quote;
		}
	}
	return out;
}

}

#endif
