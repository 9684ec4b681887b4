#include "connect.hpp"
#include "auth.hpp"
#include "known_hosts.hpp"
#include "sshkit/common/errors.hpp"

namespace sshkit {

static void verify_host(session& s, client_config const& config) {
	if(config.known_hosts_file.empty()) {
		s.log().log(logger::info, "No known_hosts file given, skipping host key check");
		return;
	}

	auto res = check_host(s, config.host, config.port, config.known_hosts_file);
	switch(res) {
		case known_host_result::match:
			return;
		case known_host_result::not_found:
			if(config.allow_unknown_host) {
				s.log().log(logger::info, "Host {} not in {}, accepting", host_form(config.host, config.port), config.known_hosts_file);
				return;
			}
			throw host_key_mismatch("host " + host_form(config.host, config.port) + " is not in " + config.known_hosts_file);
		case known_host_result::mismatch:
			throw host_key_mismatch("host key for " + host_form(config.host, config.port) + " does not match " + config.known_hosts_file);
		case known_host_result::failure:
			throw host_key_mismatch("could not verify host key for " + host_form(config.host, config.port));
	}
}

void verify_and_authenticate(session& s, client_config const& config) {
	verify_host(s, config);

	if(!config.private_key_file.empty() || !config.public_key_file.empty()) {
		public_key_auth(s, config.username, config.public_key_file, config.private_key_file, config.passphrase);
	} else {
		password_auth(s, config.username, config.password);
	}
}

}
