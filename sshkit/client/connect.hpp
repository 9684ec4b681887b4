#ifndef SSHKIT_CLIENT_CONNECT_HEADER
#define SSHKIT_CLIENT_CONNECT_HEADER

#include "client_config.hpp"
#include "session.hpp"
#include "sshkit/services/sftp/sftp_session.hpp"

namespace sshkit {

/** \brief Verify the host key and authenticate according to config
 *
 *  Throws host_key_mismatch before any authentication is attempted if the host key does not match
 *  the known_hosts file, or if the host is unknown and allow_unknown_host is not set.
 *  Uses public key authentication if key files are set, otherwise password.
 */
void verify_and_authenticate(session&, client_config const&);

/// connected, verified and authenticated session for fn, closed when fn returns or throws
template<typename Func>
auto with_ssh(engine& e, logger& log, client_config const& config, Func&& fn) {
	return with_session(e, log, config.host, config.port,
		[&](session& s) {
			verify_and_authenticate(s, config);
			return fn(s);
		}, config.session);
}

/// as with_ssh but fn is called with a sftp session
template<typename Func>
auto with_sftp(engine& e, logger& log, client_config const& config, Func&& fn) {
	return with_ssh(e, log, config,
		[&](session& s) {
			sftp::sftp_session sftp(s);
			return fn(sftp);
		});
}

}

#endif
