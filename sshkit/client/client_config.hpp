#ifndef SSHKIT_CLIENT_CONFIG_HEADER
#define SSHKIT_CLIENT_CONFIG_HEADER

#include "sshkit/common/types.hpp"

#include <chrono>

namespace sshkit {

/** \brief Settings that apply to a session and the channels opened from it
 */
struct session_settings {
	// initial blocking mode, can be changed later with session::set_blocking
	bool blocking{true};

	// chunk size used by read_all and the transfers when reading
	std::size_t read_chunk_size{0x400};

	// maximum size of a single write to the engine
	std::size_t write_chunk_size{32*1024};

	// read_all_nonblocking stops when nothing has arrived for this long
	std::chrono::milliseconds idle_timeout{500};

	// reason given to the server when disconnecting
	std::string disconnect_reason{"Done."};
};

/** \brief Everything needed to connect, verify and authenticate
 */
struct client_config {
	std::string host;
	std::uint16_t port{22};

	/// username that is used for authentication
	std::string username;

	/// password for authentication, used if no private key is set
	std::string password;

	/// key files for public key authentication
	std::string public_key_file;
	std::string private_key_file;
	std::string passphrase;

	/// known_hosts file to verify the server host key against, empty to skip the check
	std::string known_hosts_file;

	/// accept hosts that are not in known_hosts file (mismatch is always rejected)
	bool allow_unknown_host{true};

	/// terminal type for pty requests
	std::string term_type{"linux"};

	session_settings session;
};

}

#endif
