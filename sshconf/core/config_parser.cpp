
#include "config_parser.hpp"
#include "errors.hpp"
#include "keywords.hpp"

#include "sshconf/common/util.hpp"

namespace sshconf {

config_parser::config_parser(logger& log)
: log_(log)
{
}

void config_parser::reset() {
	config_ = ssh_config{};
	current_hosts_ = wildcard_host_list();
	current_values_ = keyword_set{};
	first_block_ = true;
	seen_host_ = false;
	line_number_ = 0;
}

ssh_config config_parser::parse(std::string_view data) {
	reset();

	for(auto line : split_lines(data)) {
		++line_number_;
		parse_line(line);
	}
	close_current();

	log_.log(logger::debug, "parsed {} lines into {} host blocks", line_number_, config_.size());

	ssh_config res = std::move(config_);
	reset();
	return res;
}

void config_parser::parse_line(std::string_view line) {
	// comments run from the first '#' to the end of line, there is no quoting
	auto comment = line.find('#');
	if(comment != std::string_view::npos) {
		line = line.substr(0, comment);
	}

	line = trim_left(line);
	if(trim_right(line).empty()) {
		return;
	}

	auto [first, rest] = split_first_word(line);
	if(iequals(first, host_keyword)) {
		parse_host(rest);
	} else if(iequals(first, match_keyword)) {
		fail(simple_format("Match keyword is not supported at line {}", line_number_));
	} else {
		parse_keyword(line, first, rest);
	}
}

void config_parser::parse_host(std::string_view args) {
	close_current();

	auto patterns = split_whitespace(args);
	if(patterns.empty()) {
		fail(simple_format("Empty Host keyword at line {}", line_number_));
	}

	host_list hosts;
	for(auto&& p : patterns) {
		hosts.add(parse_host_pattern(p));
	}
	current_hosts_ = std::move(hosts);
	seen_host_ = true;

	log_.log(logger::debug_trace, "line {}: Host {}", line_number_, current_hosts_.to_string());
}

void config_parser::parse_keyword(std::string_view line, std::string_view keyword, std::string_view value) {
	// the value is the rest of the line as is, only leading whitespace is dropped
	if(value.empty()) {
		fail(simple_format("Invalid syntax at line {}: {}", line_number_, trim_right(line)));
	}

	if(!is_keyword(keyword)) {
		fail(simple_format("Invalid keyword at line {}: {}", line_number_, keyword));
	}

	keyword_set line_value;
	line_value.set(keyword, std::string(value));

	// first occurrence in the block wins
	auto before = current_values_.size();
	current_values_.merge_missing(line_value);
	if(current_values_.size() == before) {
		log_.log(logger::debug_verbose, "line {}: ignoring repeated keyword {}", line_number_, keyword);
	}
}

void config_parser::close_current() {
	if(first_block_) {
		first_block_ = false;
		// nothing before the first Host line, do not emit the implicit block
		if(current_values_.empty() && !seen_host_) {
			return;
		}
	}

	log_.log(logger::debug_trace, "line {}: closing block Host {} with {} keywords",
		line_number_, current_hosts_.to_string(), current_values_.size());

	config_.append(host_block{current_hosts_, std::move(current_values_)});
	current_values_ = keyword_set{};
}

void config_parser::fail(std::string const& message) {
	// the exception carries the message, callers decide whether to report it
	log_.log(logger::debug, "{}", message);
	auto line = line_number_;
	reset();
	throw parser_error(message, line);
}

}
