#ifndef SSHKIT_CLIENT_TCP_SOCKET_HEADER
#define SSHKIT_CLIENT_TCP_SOCKET_HEADER

#include "sshkit/common/logger.hpp"
#include "sshkit/engine/engine.hpp"

#include <memory>

namespace sshkit {

/// Connected TCP stream, the socket is closed when destroyed
class tcp_socket {
public:
	/// resolve host and connect, throws connection_error if neither succeeds
	tcp_socket(std::string const& host, std::uint16_t port, logger&);
	~tcp_socket();

	tcp_socket(tcp_socket const&) = delete;
	tcp_socket& operator=(tcp_socket const&) = delete;

	bool is_open() const;
	native_socket native_handle() const;

	void close();

private:
	class impl;
	std::unique_ptr<impl> impl_;
};

}

#endif
