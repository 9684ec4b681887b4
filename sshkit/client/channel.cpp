#include "channel.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/util.hpp"

#include <exception>

namespace sshkit {

std::string_view to_string(channel_state s) {
	using enum channel_state;
	switch(s) {
		case created:       return "created";
		case open:          return "open";
		case pty_allocated: return "pty_allocated";
		case running:       return "running";
		case eof_sent:      return "eof_sent";
		case closed:        return "closed";
	}
	return "unknown";
}

channel::channel(session& s, std::unique_ptr<channel_backend> backend, std::string_view type)
: session_(s)
, log_(s.log())
, backend_(std::move(backend))
, type_(type)
{
	set_state(channel_state::open);
}

channel::~channel() {
	if(backend_ && state_ != channel_state::closed) {
		try {
			close();
		} catch(std::exception const& e) {
			log_.log(logger::error, "Failed to close {} channel: {}", type_, e.what());
		}
	}
}

channel channel::open_session(session& s) {
	std::unique_ptr<channel_backend> b;
	auto res = s.retry([&]{ return s.backend().open_session_channel(b); });
	if(res != engine_status::ok || !b) {
		auto msg = s.error_message("failed to open session channel");
		s.log().log(logger::error, "{}", msg);
		throw channel_error(msg, s.last_error().code);
	}
	return channel(s, std::move(b), "session");
}

channel channel::open_scp_send(session& s, std::string_view remote_path, std::uint32_t mode, std::uint64_t size) {
	std::unique_ptr<channel_backend> b;
	auto res = s.retry([&]{ return s.backend().scp_send(remote_path, mode, size, b); });
	if(res != engine_status::ok || !b) {
		auto msg = s.error_message("failed to open scp send channel for '" + std::string(remote_path) + "'");
		s.log().log(logger::error, "{}", msg);
		throw channel_error(msg, s.last_error().code);
	}
	s.log().log(logger::debug_trace, "scp send channel open [path={}, mode={}, size={}]", remote_path, mode, size);

	channel ch(s, std::move(b), "scp-send");
	ch.set_state(channel_state::running);
	return ch;
}

scp_receive_channel channel::open_scp_receive(session& s, std::string_view remote_path) {
	std::unique_ptr<channel_backend> b;
	scp_file_info info;
	auto res = s.retry([&]{ return s.backend().scp_receive(remote_path, b, info); });
	if(res != engine_status::ok || !b) {
		auto msg = s.error_message("failed to open scp receive channel for '" + std::string(remote_path) + "'");
		s.log().log(logger::error, "{}", msg);
		throw channel_error(msg, s.last_error().code);
	}
	s.log().log(logger::debug_trace, "scp receive channel open [path={}, mode={}, size={}]", remote_path, info.mode, info.size);

	channel ch(s, std::move(b), "scp-receive");
	ch.set_state(channel_state::running);
	return scp_receive_channel{std::move(ch), info.size, info.mode};
}

void channel::set_state(channel_state s) {
	if(s < state_) {
		throw channel_error("invalid channel state transition " + std::string(to_string(state_)) + " -> " + std::string(to_string(s)));
	}
	log_.log(logger::debug_trace, "{} channel state [{} -> {}]", type_, to_string(state_), to_string(s));
	state_ = s;
}

void channel::require_state(std::string_view op, channel_state min, channel_state max) const {
	if(!backend_ || state_ < min || state_ > max) {
		log_.log(logger::error, "Invalid {} on {} channel [state={}]", op, type_, to_string(state_));
		throw channel_error("cannot " + std::string(op) + " in channel state " + std::string(to_string(state_)));
	}
}

void channel::fail(std::string_view what, std::string_view op) {
	auto msg = session_.error_message(std::string(what) + " (" + std::string(op) + ")");
	log_.log(logger::error, "{}", msg);
	throw channel_error(msg, session_.last_error().code);
}

void channel::request_pty(std::string_view term) {
	require_state("request pty", channel_state::open, channel_state::open);
	auto res = session_.retry([&]{ return backend_->request_pty(term); });
	if(res != engine_status::ok) {
		fail("failed to request pty", term);
	}
	set_state(channel_state::pty_allocated);
}

void channel::execute(std::string_view command) {
	require_state("execute", channel_state::open, channel_state::pty_allocated);
	log_.log(logger::debug, "executing command: {}", command);
	auto res = session_.retry([&]{ return backend_->exec(command); });
	if(res != engine_status::ok) {
		fail("failed to execute command", command);
	}
	set_state(channel_state::running);
}

void channel::start_shell() {
	require_state("start shell", channel_state::open, channel_state::pty_allocated);
	auto res = session_.retry([&]{ return backend_->shell(); });
	if(res != engine_status::ok) {
		fail("failed to start shell", "shell");
	}
	set_state(channel_state::running);
}

std::optional<byte_vector> channel::read(std::size_t max) {
	require_state("read", channel_state::open, channel_state::eof_sent);

	byte_vector buf(max);
	io_result res;
	if(session_.blocking()) {
		res = session_.retry([&]{ return backend_->read(buf); });
	} else {
		res = backend_->read(buf);
		if(res.status == engine_status::would_block) {
			return std::nullopt;
		}
	}

	if(res.status != engine_status::ok) {
		fail("failed to read from channel", type_);
	}

	buf.resize(res.bytes);
	log_.log(logger::debug_verbose, "read {} bytes from {} channel", res.bytes, type_);
	return buf;
}

std::size_t channel::write(const_span data) {
	require_state("write", channel_state::open, channel_state::running);

	std::size_t const chunk_size = std::max<std::size_t>(session_.settings().write_chunk_size, 1);
	std::size_t written = 0;
	while(written < data.size()) {
		auto chunk = safe_subspan(data, written, chunk_size);
		io_result res = backend_->write(chunk);
		if(res.status == engine_status::error) {
			fail("failed to write to channel", type_);
		}
		if(res.status == engine_status::would_block || res.bytes == 0) {
			if(!session_.blocking()) {
				break;
			}
			session_.wait_socket();
			continue;
		}
		written += res.bytes;
	}

	log_.log(logger::debug_verbose, "wrote {} of {} bytes to {} channel", written, data.size(), type_);
	return written;
}

void channel::write_all(const_span data) {
	std::size_t written = 0;
	while(written < data.size()) {
		written += write(safe_subspan(data, written));
		if(written < data.size()) {
			session_.wait_socket();
		}
	}
}

void channel::send_eof() {
	require_state("send eof", channel_state::open, channel_state::running);
	auto res = session_.retry([&]{ return backend_->send_eof(); });
	if(res != engine_status::ok) {
		fail("failed to send eof", type_);
	}
	set_state(channel_state::eof_sent);
}

void channel::wait_eof() {
	require_state("wait eof", channel_state::open, channel_state::eof_sent);
	auto res = session_.retry([&]{ return backend_->wait_eof(); });
	if(res != engine_status::ok) {
		fail("failed to wait for eof", type_);
	}
}

bool channel::eof() {
	if(state_ == channel_state::closed) {
		return true;
	}
	require_state("check eof", channel_state::open, channel_state::eof_sent);
	return backend_->eof();
}

bool channel::poll_read(std::chrono::milliseconds timeout) {
	require_state("poll", channel_state::open, channel_state::eof_sent);
	if(backend_->poll_read() || backend_->eof()) {
		return true;
	}
	return session_.wait_socket(timeout);
}

byte_vector channel::read_all() {
	std::size_t const chunk_size = std::max<std::size_t>(session_.settings().read_chunk_size, 1);
	byte_vector res;
	while(true) {
		auto chunk = read(chunk_size);
		if(!chunk) {
			session_.wait_socket();
			continue;
		}
		if(chunk->empty()) {
			break;
		}
		append(res, *chunk);
	}
	log_.log(logger::debug_trace, "read all {} bytes from {} channel", res.size(), type_);
	return res;
}

byte_vector channel::read_all_nonblocking(std::chrono::milliseconds idle_timeout) {
	std::size_t const chunk_size = std::max<std::size_t>(session_.settings().read_chunk_size, 1);
	// the socket can become readable without data for this channel, a blocking read would then wait forever
	blocking_mode_guard guard(session_, false);
	byte_vector res;
	while(poll_read(idle_timeout)) {
		auto chunk = read(chunk_size);
		if(!chunk) {
			continue;
		}
		if(chunk->empty()) {
			break;
		}
		append(res, *chunk);
	}
	log_.log(logger::debug_trace, "read {} bytes from {} channel before eof or idle timeout", res.size(), type_);
	return res;
}

void channel::close() {
	if(state_ == channel_state::closed || !backend_) {
		return;
	}

	auto res = session_.retry([&]{ return backend_->close(); });
	if(res == engine_status::ok) {
		res = session_.retry([&]{ return backend_->wait_closed(); });
	}
	if(res != engine_status::ok) {
		// the channel cannot be used anymore, the exit status stays unavailable
		state_ = channel_state::closed;
		fail("failed to close channel", type_);
	}

	exit_status_ = backend_->exit_status();
	set_state(channel_state::closed);
	log_.log(logger::info, "{} channel closed [exit status={}]", type_, *exit_status_);
}

int channel::exit_status() const {
	if(!exit_status_) {
		throw channel_error("exit status of " + type_ + " channel is not available before close");
	}
	return *exit_status_;
}

}
