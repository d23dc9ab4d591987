
#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace sshconf {

std::string_view to_string(logger::type t) {
	if(t == logger::error) return "error";
	if(t == logger::info) return "info";
	if(t == logger::debug) return "debug";
	if(t == logger::debug_verbose) return "verbose";
	if(t == logger::debug_trace) return "trace";
	return "log";
}

void stdout_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	std::puts(s.c_str());
}

void stderr_logger::do_log_line(logger::type t, std::string const& s, std::source_location&&) {
	std::fprintf(stderr, "%.*s: %s\n", int(to_string(t).size()), to_string(t).data(), s.c_str());
}

tagged_logger::tagged_logger(logger& l, std::string tag)
: logger(l.level())
, log_(l)
, tag_(std::move(tag))
{}

void tagged_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
