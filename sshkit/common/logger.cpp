#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace sshkit {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error:         return "error";
		case logger::info:          return "info";
		case logger::debug:         return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace:   return "trace";
		default: break;
	}
	return "log";
}

namespace detail {

std::size_t write_until_placeholder(std::ostream& out, std::string_view fmt, std::size_t pos) {
	while(pos < fmt.size()) {
		char c = fmt[pos];
		bool const has_next = pos + 1 < fmt.size();
		if(c == '{' && has_next && fmt[pos+1] == '}') {
			return pos + 2;
		}
		if((c == '{' || c == '}') && has_next && fmt[pos+1] == c) {
			// escaped brace
			++pos;
		}
		out << c;
		++pos;
	}
	return std::string_view::npos;
}

}

void stdout_logger::do_log_line(logger::type t, std::string const& s, std::source_location&&) {
	if(t == logger::error) {
		std::fprintf(stderr, "[%s] %s\n", to_string(t).data(), s.c_str());
	} else {
		std::printf("[%s] %s\n", to_string(t).data(), s.c_str());
	}
}

session_logger::session_logger(logger& l, std::string tag)
: logger(log_all)
, log_(l)
, tag_(std::move(tag))
{}

void session_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
