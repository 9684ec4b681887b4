#include "errors.hpp"

namespace sshkit {

std::string_view to_string(error_kind k) {
	using enum error_kind;
	switch(k) {
		case connection:        return "connection error";
		case handshake:         return "handshake error";
		case host_key_mismatch: return "host key mismatch";
		case auth:              return "authentication error";
		case channel:           return "channel error";
		case transfer:          return "transfer error";
		case io:                return "io error";
	}
	return "unknown error";
}

sshkit_error::sshkit_error(error_kind kind, std::string const& message, int code)
: std::runtime_error(message)
, kind_(kind)
, code_(code)
{
}

}
