#ifndef SSHKIT_CLIENT_SESSION_HEADER
#define SSHKIT_CLIENT_SESSION_HEADER

#include "client_config.hpp"
#include "tcp_socket.hpp"
#include "sshkit/engine/engine.hpp"

#include <memory>
#include <type_traits>

namespace sshkit {

inline engine_status status_of(engine_status s) { return s; }
inline engine_status status_of(io_result const& r) { return r.status; }

/** \brief One connection to a server
 *
 *  The constructor connects the socket and completes the ssh handshake. The session is disconnected
 *  and freed exactly once, either by close() or by the destructor.
 *
 *  Channels, sftp sessions and handles keep a reference to the session and must be destroyed before it.
 */
class session {
public:
	session(engine&, logger&, std::string host, std::uint16_t port, session_settings = {});
	~session();

	session(session const&) = delete;
	session& operator=(session const&) = delete;

	std::string const& host() const { return host_; }
	std::uint16_t port() const { return port_; }
	logger& log() { return log_; }
	session_settings const& settings() const { return settings_; }

	/// affects all subsequent calls on this session and every channel and sftp handle opened from it
	void set_blocking(bool);
	bool blocking() const { return blocking_; }

	/// disconnect with the given reason and release the session
	void close();
	void close(std::string_view reason);
	bool is_open() const { return backend_ != nullptr; }

	/// wait until the engine can make progress, returns false on timeout
	bool wait_socket(std::chrono::milliseconds timeout = infinite_wait);

	/// call op again as long as it reports would_block, waiting for the socket in between
	template<typename Op>
	auto retry(Op&& op) -> std::invoke_result_t<Op&>;

	/// throws connection_error if the session was closed
	session_backend& backend();

	engine_error last_error() const;

	/// "<what>: <engine error message> [code=<code>]"
	std::string error_message(std::string_view what) const;

private:
	session_logger log_;
	std::string host_;
	std::uint16_t port_;
	session_settings settings_;
	bool blocking_;

	tcp_socket socket_;
	std::unique_ptr<session_backend> backend_;
};

template<typename Op>
auto session::retry(Op&& op) -> std::invoke_result_t<Op&> {
	auto res = op();
	while(status_of(res) == engine_status::would_block) {
		wait_socket();
		res = op();
	}
	return res;
}

/// switches the session to the given blocking mode and restores the previous mode when destroyed
class blocking_mode_guard {
public:
	blocking_mode_guard(session& s, bool blocking)
	: session_(s)
	, previous_(s.blocking())
	{
		if(previous_ != blocking) {
			session_.set_blocking(blocking);
		}
	}

	~blocking_mode_guard() {
		if(session_.is_open() && session_.blocking() != previous_) {
			session_.set_blocking(previous_);
		}
	}

	blocking_mode_guard(blocking_mode_guard const&) = delete;
	blocking_mode_guard& operator=(blocking_mode_guard const&) = delete;

private:
	session& session_;
	bool previous_;
};

/// run fn with a session that is closed when fn returns or throws
template<typename Func>
auto with_session(engine& e, logger& log, std::string const& host, std::uint16_t port, Func&& fn, session_settings settings = {}) {
	session s(e, log, host, port, std::move(settings));
	return fn(s);
}

}

#endif
