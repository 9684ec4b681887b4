#ifndef SSHKIT_LOGGER_HEADER
#define SSHKIT_LOGGER_HEADER

#include "types.hpp"

#include <sstream>
#include <source_location>
#include <type_traits>

namespace sshkit {

/** \brief Format log message
 *
 *  Each {} in fmt is replaced by the next argument, "{{" and "}}" produce literal braces.
 *  Booleans are written as true/false. Arguments without placeholder are ignored.
 */
template<typename... Args>
std::string format_log_message(std::string_view fmt, Args const&...);

class logger {
public:
	enum type {
		error         = 0x1,
		info          = 0x2,
		debug         = 0x4,
		debug_verbose = 0x08,
		debug_trace   = 0x10,

		log_none = 0,
		log_all = info | error | debug | debug_trace | debug_verbose
	};

	explicit logger(type level = log_all)
	: level_(level)
	{}

	virtual ~logger() = default;

	logger(logger const&) = delete;
	logger& operator=(logger const&) = delete;

	// captures the call site together with the message type
	struct log_type {
		log_type(logger::type t, std::source_location location = std::source_location::current())
		: type(t)
		, location(std::move(location))
		{}

		logger::type type;
		std::source_location location;
	};

	template<typename... Args>
	void log(log_type t, std::string_view fmt, Args const&... args) {
		if(would_log(t.type)) {
			do_log_line(t.type, format_log_message(fmt, args...), std::move(t.location));
		}
	}

	void log_line(type t, std::string const& s, std::source_location&& l = std::source_location::current()) {
		if(would_log(t)) {
			do_log_line(t, s, std::move(l));
		}
	}

	bool would_log(type t) const {
		return (t & level_) != 0;
	}

	type level() const { return level_; }
	void set_level(type t) {
		level_ = t;
	}

protected:
	virtual void do_log_line(type, std::string const&, std::source_location&&) = 0;

private:
	type level_;
};

std::string_view to_string(logger::type);

/// writes errors to stderr and everything else to stdout
class stdout_logger : public logger {
public:
	using logger::logger;

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
};

/// prefixes every line with a tag (e.g. "[host:22] ") and forwards to another logger
class session_logger : public logger {
public:
	session_logger(logger&, std::string tag);

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
private:
	logger& log_;
	std::string tag_;
};

namespace detail {

// copies fmt to out until the next placeholder, returns position after it or npos
std::size_t write_until_placeholder(std::ostream& out, std::string_view fmt, std::size_t pos);

template<typename T>
void write_log_arg(std::ostream& out, T const& v) {
	if constexpr(std::is_same_v<T, bool>) {
		out << (v ? "true" : "false");
	} else {
		out << v;
	}
}

}

template<typename... Args>
std::string format_log_message(std::string_view fmt, Args const&... args) {
	std::ostringstream out;
	std::size_t pos = 0;

	auto replace = [&](auto const& arg) {
		if(pos != std::string_view::npos) {
			pos = detail::write_until_placeholder(out, fmt, pos);
			if(pos != std::string_view::npos) {
				detail::write_log_arg(out, arg);
			}
		}
	};
	(replace(args), ...);

	while(pos != std::string_view::npos) {
		// placeholders without arguments are written as is
		pos = detail::write_until_placeholder(out, fmt, pos);
		if(pos != std::string_view::npos) {
			out << "{}";
		}
	}

	return out.str();
}

}

#endif
