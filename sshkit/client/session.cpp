#include "session.hpp"
#include "sshkit/common/errors.hpp"

#include <exception>

namespace sshkit {

session::session(engine& e, logger& log, std::string host, std::uint16_t port, session_settings settings)
: log_(log, "[" + host + ":" + std::to_string(port) + "] ")
, host_(std::move(host))
, port_(port)
, settings_(std::move(settings))
, blocking_(settings_.blocking)
, socket_(host_, port_, log_)
, backend_(e.create_session(log_))
{
	if(!backend_) {
		log_.log(logger::error, "Failed to create engine session");
		throw handshake_error("failed to create ssh session for " + host_);
	}

	backend_->set_blocking(blocking_);

	log_.log(logger::debug_trace, "starting handshake [blocking={}]", blocking_);
	auto res = retry([&]{ return backend_->handshake(socket_.native_handle()); });
	if(res != engine_status::ok) {
		auto msg = error_message("ssh handshake failed");
		log_.log(logger::error, "{}", msg);
		throw handshake_error(msg, last_error().code);
	}

	log_.log(logger::info, "SSH session established");
}

session::~session() {
	try {
		close();
	} catch(std::exception const& e) {
		log_.log(logger::error, "Failed to close session: {}", e.what());
	}
}

void session::set_blocking(bool b) {
	log_.log(logger::debug_trace, "setting blocking mode [{} -> {}]", blocking_, b);
	blocking_ = b;
	if(backend_) {
		backend_->set_blocking(b);
	}
}

void session::close() {
	close(settings_.disconnect_reason);
}

void session::close(std::string_view reason) {
	if(!backend_) {
		return;
	}

	log_.log(logger::info, "Disconnecting: {}", reason);
	auto res = retry([&]{ return backend_->disconnect(reason); });
	if(res != engine_status::ok) {
		log_.log(logger::error, "{}", error_message("disconnect failed"));
	}

	backend_.reset();
	socket_.close();
}

bool session::wait_socket(std::chrono::milliseconds timeout) {
	return backend().wait_socket(timeout);
}

session_backend& session::backend() {
	if(!backend_) {
		throw connection_error("session to " + host_ + " is closed");
	}
	return *backend_;
}

engine_error session::last_error() const {
	if(!backend_) {
		return engine_error{0, "session is closed"};
	}
	return backend_->last_error();
}

std::string session::error_message(std::string_view what) const {
	auto err = last_error();
	std::string res(what);
	if(!err.message.empty()) {
		res += ": " + err.message;
	}
	return res + " [code=" + std::to_string(err.code) + "]";
}

}
