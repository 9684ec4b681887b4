#include "auth.hpp"
#include "session.hpp"
#include "sshkit/common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace sshkit {

static void require_readable(logger& log, std::string const& path, std::string_view what) {
	if(path.empty()) {
		log.log(logger::error, "No {} key file given", what);
		throw auth_error("no " + std::string(what) + " key file given");
	}
	std::ifstream in(path, std::ios_base::binary);
	if(!in) {
		int err = errno;
		log.log(logger::error, "Cannot read {} key file '{}': {}", what, path, std::strerror(err));
		throw auth_error("cannot read " + std::string(what) + " key file '" + path + "': " + std::strerror(err), err);
	}
}

void public_key_auth(session& s, std::string_view username, std::string const& public_key_path,
	std::string const& private_key_path, std::string_view passphrase)
{
	auto& log = s.log();
	// without public key file the engine derives the public key from the private key
	if(!public_key_path.empty()) {
		require_readable(log, public_key_path, "public");
	}
	require_readable(log, private_key_path, "private");

	log.log(logger::debug_trace, "public key authentication [user={}, key={}]", username, public_key_path);

	auto res = s.retry([&]{ return s.backend().auth_public_key_file(username, public_key_path, private_key_path, passphrase); });
	if(res != engine_status::ok || !s.backend().authenticated()) {
		auto msg = s.error_message("public key authentication failed for user '" + std::string(username) + "'");
		log.log(logger::error, "{}", msg);
		throw auth_error(msg, s.last_error().code);
	}

	log.log(logger::info, "Authenticated as {} with public key", username);
}

void password_auth(session& s, std::string_view username, std::string_view password) {
	auto& log = s.log();
	log.log(logger::debug_trace, "password authentication [user={}]", username);

	auto res = s.retry([&]{ return s.backend().auth_password(username, password); });
	if(res != engine_status::ok || !s.backend().authenticated()) {
		auto msg = s.error_message("password authentication failed for user '" + std::string(username) + "'");
		log.log(logger::error, "{}", msg);
		throw auth_error(msg, s.last_error().code);
	}

	log.log(logger::info, "Authenticated as {} with password", username);
}

}
