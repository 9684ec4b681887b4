#ifndef SSHKIT_CLIENT_CHANNEL_HEADER
#define SSHKIT_CLIENT_CHANNEL_HEADER

#include "session.hpp"

#include <optional>

namespace sshkit {

enum class channel_state {
	created,
	open,          //channel is open, pty and exec/shell can be requested
	pty_allocated,
	running,       //exec/shell started or scp transfer set up, data flows
	eof_sent,      //we have sent eof, can still read
	closed         //exit status is available
};
std::string_view to_string(channel_state);

struct scp_receive_channel;

/** \brief One multiplexed stream of a session
 *
 *  State transitions are strictly forward, calling an operation in the wrong state throws channel_error.
 *  The channel must not outlive its session, the destructor closes the channel if needed.
 */
class channel {
public:
	/// open "session" channel for exec or shell
	static channel open_session(session&);

	/// open scp upload channel for remote_path with the given mode and size
	static channel open_scp_send(session&, std::string_view remote_path, std::uint32_t mode, std::uint64_t size);

	/// open scp download channel, the remote side declares size and mode
	static scp_receive_channel open_scp_receive(session&, std::string_view remote_path);

	channel(channel&&) = default;
	~channel();

	channel_state state() const { return state_; }

	void request_pty(std::string_view term);

	/// only one exec or shell per channel
	void execute(std::string_view command);
	void start_shell();

	/** \brief Read up to max bytes of stdout data
	 *
	 *  Returns nullopt if the session is non-blocking and no data is available,
	 *  empty vector at end of data.
	 */
	std::optional<byte_vector> read(std::size_t max);

	/// write in chunks, returns less than data size only if the session is non-blocking and the engine would block
	std::size_t write(const_span data);

	/// write everything, waiting for the socket as needed
	void write_all(const_span data);
	void write_all(std::string_view data) { write_all(to_span(data)); }

	void send_eof();
	void wait_eof();

	/// true if remote side has sent eof (or channel is closed)
	bool eof();

	/// true if data or eof is pending, or the socket becomes readable within timeout
	bool poll_read(std::chrono::milliseconds timeout);

	/// read until end of data
	byte_vector read_all();

	/// read until end of data or until nothing has arrived for idle_timeout, reads are non-blocking regardless of the session mode
	byte_vector read_all_nonblocking(std::chrono::milliseconds idle_timeout);
	byte_vector read_all_nonblocking() { return read_all_nonblocking(session_.settings().idle_timeout); }

	/// close and wait for the remote close, does nothing if already closed
	void close();

	/// throws channel_error if the channel is not closed
	int exit_status() const;

private:
	channel(session&, std::unique_ptr<channel_backend>, std::string_view type);

	void set_state(channel_state);
	void require_state(std::string_view op, channel_state min, channel_state max) const;
	[[noreturn]] void fail(std::string_view what, std::string_view op);

private:
	session& session_;
	logger& log_;
	std::unique_ptr<channel_backend> backend_;
	std::string type_;
	channel_state state_{channel_state::created};
	std::optional<int> exit_status_;
};

struct scp_receive_channel {
	channel chan;
	/// declared by the remote side
	std::uint64_t size{};
	std::uint32_t mode{};
};

template<typename T>
struct channel_result {
	int exit_status{};
	T value;
};

/** \brief Create channel, run action, close and collect exit status
 *
 *  create() returns the object holding the channel, extract gives access to the channel in it and
 *  action is called with the created object. The channel is freed when this returns or action throws.
 */
template<typename Create, typename Extract, typename Action>
auto with_channel_by(Create&& create, Extract&& extract, Action&& action) {
	auto created = create();
	channel& ch = extract(created);
	auto value = action(created);
	ch.close();
	return channel_result<decltype(value)>{ch.exit_status(), std::move(value)};
}

template<typename Action>
auto with_channel(session& s, Action&& action) {
	return with_channel_by(
		[&]{ return channel::open_session(s); },
		[](channel& c) -> channel& { return c; },
		std::forward<Action>(action));
}

}

#endif
