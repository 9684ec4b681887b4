#ifndef SSHKIT_ERRORS_HEADER
#define SSHKIT_ERRORS_HEADER

#include "types.hpp"

#include <stdexcept>

namespace sshkit {

enum class error_kind {
	connection,        // name resolution or socket failure
	handshake,         // ssh protocol negotiation failed
	host_key_mismatch, // presented host key differs from the known_hosts entry
	auth,              // credentials rejected or key files unusable
	channel,           // open/read/write/close failure on a channel
	transfer,          // scp/sftp size mismatch, truncated data or remote path error
	io                 // local file access failure
};
std::string_view to_string(error_kind);

/// Base of all errors thrown by sshkit, code is the engine (or errno/sftp status) error code if any
class sshkit_error : public std::runtime_error {
public:
	sshkit_error(error_kind kind, std::string const& message, int code = 0);

	error_kind kind() const { return kind_; }
	int code() const { return code_; }

private:
	error_kind kind_;
	int code_;
};

struct connection_error : sshkit_error {
	connection_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::connection, message, code)
	{}
};

struct handshake_error : sshkit_error {
	handshake_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::handshake, message, code)
	{}
};

struct host_key_mismatch : sshkit_error {
	host_key_mismatch(std::string const& message)
	: sshkit_error(error_kind::host_key_mismatch, message)
	{}
};

struct auth_error : sshkit_error {
	auth_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::auth, message, code)
	{}
};

struct channel_error : sshkit_error {
	channel_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::channel, message, code)
	{}
};

struct transfer_error : sshkit_error {
	transfer_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::transfer, message, code)
	{}
};

struct io_error : sshkit_error {
	io_error(std::string const& message, int code = 0)
	: sshkit_error(error_kind::io, message, code)
	{}
};

}

#endif
