
#include "util.hpp"

#include <istream>
#include <iterator>

namespace sshconf {

static char lower_ascii(char c) {
	if(c >= 'A' && c <= 'Z') {
		return char(c - 'A' + 'a');
	}
	return c;
}

std::string to_lower(std::string_view s) {
	std::string res;
	res.reserve(s.size());
	for(char c : s) {
		res += lower_ascii(c);
	}
	return res;
}

bool iequals(std::string_view s1, std::string_view s2) {
	if(s1.size() != s2.size()) {
		return false;
	}
	for(std::size_t i = 0; i != s1.size(); ++i) {
		if(lower_ascii(s1[i]) != lower_ascii(s2[i])) {
			return false;
		}
	}
	return true;
}

std::string_view trim_left(std::string_view s) {
	while(!s.empty() && is_space(s.front())) {
		s.remove_prefix(1);
	}
	return s;
}

std::string_view trim_right(std::string_view s) {
	while(!s.empty() && is_space(s.back())) {
		s.remove_suffix(1);
	}
	return s;
}

std::string_view trim(std::string_view s) {
	return trim_right(trim_left(s));
}

std::vector<std::string_view> split_whitespace(std::string_view s) {
	std::vector<std::string_view> res;
	s = trim_left(s);
	while(!s.empty()) {
		auto [word, rest] = split_first_word(s);
		res.push_back(word);
		s = rest;
	}
	return res;
}

std::pair<std::string_view, std::string_view> split_first_word(std::string_view s) {
	std::size_t pos = 0;
	while(pos != s.size() && !is_space(s[pos])) {
		++pos;
	}
	return {s.substr(0, pos), trim_left(s.substr(pos))};
}

std::vector<std::string_view> split_lines(std::string_view s) {
	std::vector<std::string_view> res;
	std::size_t start = 0;
	for(std::size_t i = 0; i != s.size(); ++i) {
		if(s[i] == '\n' || s[i] == '\r') {
			res.push_back(s.substr(start, i-start));
			if(s[i] == '\r' && i+1 != s.size() && s[i+1] == '\n') {
				++i;
			}
			start = i+1;
		}
	}
	if(start < s.size()) {
		res.push_back(s.substr(start));
	}
	return res;
}

std::string read_stream(std::istream& in) {
	return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}
