#ifndef SSHKIT_ENGINE_HEADER
#define SSHKIT_ENGINE_HEADER

#include "sshkit/common/logger.hpp"
#include "sshkit/common/types.hpp"
#include "sshkit/services/sftp/sftp.hpp"

#include <chrono>
#include <memory>
#include <optional>

/*
	Interface to the SSH protocol engine that implements the transport layer (key exchange, ciphers,
	packet framing, channel multiplexing). sshkit drives the session and channel life cycles on top of it.

	Every call that can make no progress in non-blocking mode returns engine_status::would_block,
	the caller then waits on the socket (session_backend::wait_socket) and calls again with the same arguments.
*/

namespace sshkit {

enum class engine_status {
	ok,
	would_block,
	error
};
std::string_view to_string(engine_status);

struct engine_error {
	int code{};
	std::string message;
};

struct io_result {
	engine_status status{engine_status::ok};
	std::size_t bytes{};
};

using native_socket = int;

inline constexpr std::chrono::milliseconds infinite_wait{-1};

/// calls op until it no longer returns would_block, calling wait between attempts
template<typename Op, typename Wait>
engine_status complete_with_wait(Op&& op, Wait&& wait) {
	engine_status res = op();
	while(res == engine_status::would_block) {
		wait();
		res = op();
	}
	return res;
}

enum class host_key_type {
	unknown,
	rsa,
	dss,
	ecdsa_256,
	ecdsa_384,
	ecdsa_521,
	ed25519
};

/// key type name as used in known_hosts file, e.g. "ssh-ed25519"
std::string_view to_string(host_key_type);
host_key_type host_key_type_from_string(std::string_view);

struct host_key {
	host_key_type type{host_key_type::unknown};
	/// key blob as sent by the server (same as base64 decoded known_hosts key)
	byte_vector data;
};

struct scp_file_info {
	std::uint64_t size{};
	std::uint32_t mode{};
};

class channel_backend {
public:
	/// frees the channel
	virtual ~channel_backend() = default;

	virtual engine_status request_pty(std::string_view term) = 0;
	virtual engine_status exec(std::string_view command) = 0;
	virtual engine_status shell() = 0;

	/// read stdout data, bytes == 0 with status ok means end of data
	virtual io_result read(span buffer) = 0;
	virtual io_result write(const_span data) = 0;

	/// true if data is already buffered and can be read without waiting
	virtual bool poll_read() = 0;
	/// true if remote side has sent eof
	virtual bool eof() = 0;

	virtual engine_status send_eof() = 0;
	virtual engine_status wait_eof() = 0;
	virtual engine_status close() = 0;
	virtual engine_status wait_closed() = 0;

	/// valid after the channel was closed
	virtual int exit_status() = 0;
};

class sftp_handle_backend {
public:
	/// frees the handle without closing it remotely if close() was not called
	virtual ~sftp_handle_backend() = default;

	/// bytes == 0 with status ok means end of file
	virtual io_result read(span buffer) = 0;
	virtual io_result write(const_span data) = 0;

	/// entry is not set with status ok when there are no more entries
	virtual engine_status read_dir(std::optional<sftp::dir_entry>& entry) = 0;
	virtual engine_status fstat(sftp::file_attributes& attrs) = 0;
	virtual engine_status close() = 0;
};

enum class sftp_open_type {
	file,
	directory
};

class sftp_backend {
public:
	virtual ~sftp_backend() = default;

	virtual engine_status open(std::string_view path, sftp::open_mode flags, std::uint32_t mode, sftp_open_type type, std::unique_ptr<sftp_handle_backend>& out) = 0;
	virtual engine_status rename(std::string_view old_path, std::string_view new_path, sftp::rename_flags flags) = 0;
	virtual engine_status stat(std::string_view path, sftp::file_attributes& attrs) = 0;
	virtual engine_status unlink(std::string_view path) = 0;
	virtual engine_status mkdir(std::string_view path, std::uint32_t mode) = 0;
	virtual engine_status rmdir(std::string_view path) = 0;
	virtual engine_status shutdown() = 0;

	/// status of the last failed sftp request
	virtual sftp::sftp_error last_error() const = 0;
};

class session_backend {
public:
	/// frees the session
	virtual ~session_backend() = default;

	virtual void set_blocking(bool) = 0;
	virtual engine_status handshake(native_socket) = 0;

	/// the host key presented by the server, set after handshake
	virtual std::optional<host_key> get_host_key() const = 0;

	virtual engine_status auth_password(std::string_view username, std::string_view password) = 0;
	virtual engine_status auth_public_key_file(std::string_view username, std::string const& public_key_path,
		std::string const& private_key_path, std::string_view passphrase) = 0;
	virtual bool authenticated() const = 0;

	virtual engine_status open_session_channel(std::unique_ptr<channel_backend>& out) = 0;
	virtual engine_status scp_send(std::string_view path, std::uint32_t mode, std::uint64_t size, std::unique_ptr<channel_backend>& out) = 0;
	virtual engine_status scp_receive(std::string_view path, std::unique_ptr<channel_backend>& out, scp_file_info& info) = 0;
	virtual engine_status sftp_init(std::unique_ptr<sftp_backend>& out) = 0;

	/// wait until the socket is ready for the direction the engine is blocked on, returns false on timeout
	virtual bool wait_socket(std::chrono::milliseconds timeout) = 0;

	virtual engine_status disconnect(std::string_view description) = 0;

	virtual engine_error last_error() const = 0;
};

/// Factory for engine sessions
class engine {
public:
	virtual ~engine() = default;

	virtual std::unique_ptr<session_backend> create_session(logger&) = 0;
};

}

#endif
