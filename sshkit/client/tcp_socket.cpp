#include "tcp_socket.hpp"
#include "sshkit/common/errors.hpp"

#include <asio.hpp>

#include <string>

namespace sshkit {

using tcp = asio::ip::tcp;

class tcp_socket::impl {
public:
	impl()
	: socket_(io_context_)
	{}

	asio::io_context io_context_;
	tcp::socket socket_;
};

tcp_socket::tcp_socket(std::string const& host, std::uint16_t port, logger& log)
: impl_(std::make_unique<impl>())
{
	log.log(logger::info, "Resolving {}:{}", host, port);

	asio::error_code ec;
	tcp::resolver resolver(impl_->io_context_);
	auto endpoints = resolver.resolve(host, std::to_string(port), ec);
	if(ec) {
		log.log(logger::error, "Failed to resolve {}: {}", host, ec.message());
		throw connection_error("failed to resolve '" + host + "': " + ec.message(), ec.value());
	}

	auto ep = asio::connect(impl_->socket_, endpoints, ec);
	if(ec) {
		log.log(logger::error, "Connect to {}:{} failed: {}", host, port, ec.message());
		// connect leaves the last tried socket open
		asio::error_code ignored;
		impl_->socket_.close(ignored);
		throw connection_error("failed to connect to '" + host + ":" + std::to_string(port) + "': " + ec.message(), ec.value());
	}

	log.log(logger::info, "Connected to {}", ep.address().to_string());
}

tcp_socket::~tcp_socket() {
	close();
}

bool tcp_socket::is_open() const {
	return impl_->socket_.is_open();
}

native_socket tcp_socket::native_handle() const {
	return impl_->socket_.native_handle();
}

void tcp_socket::close() {
	if(impl_->socket_.is_open()) {
		asio::error_code ec;
		impl_->socket_.shutdown(tcp::socket::shutdown_both, ec);
		impl_->socket_.close(ec);
	}
}

}
