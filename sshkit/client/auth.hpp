#ifndef SSHKIT_CLIENT_AUTH_HEADER
#define SSHKIT_CLIENT_AUTH_HEADER

#include "sshkit/common/types.hpp"

namespace sshkit {

class session;

/// authenticate with key pair files, throws auth_error if rejected or the key files are unusable.
/// The public key path can be empty.
void public_key_auth(session&, std::string_view username, std::string const& public_key_path,
	std::string const& private_key_path, std::string_view passphrase = {});

/// authenticate with password, throws auth_error if rejected
void password_auth(session&, std::string_view username, std::string_view password);

}

#endif
