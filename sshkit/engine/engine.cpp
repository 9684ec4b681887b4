#include "engine.hpp"

namespace sshkit {

std::string_view to_string(engine_status s) {
	using enum engine_status;
	switch(s) {
		case ok:          return "ok";
		case would_block: return "would_block";
		case error:       return "error";
	}
	return "unknown";
}

std::string_view to_string(host_key_type t) {
	using enum host_key_type;
	switch(t) {
		case rsa:       return "ssh-rsa";
		case dss:       return "ssh-dss";
		case ecdsa_256: return "ecdsa-sha2-nistp256";
		case ecdsa_384: return "ecdsa-sha2-nistp384";
		case ecdsa_521: return "ecdsa-sha2-nistp521";
		case ed25519:   return "ssh-ed25519";
		case unknown:   break;
	}
	return "unknown";
}

host_key_type host_key_type_from_string(std::string_view s) {
	using enum host_key_type;
	for(auto t : {rsa, dss, ecdsa_256, ecdsa_384, ecdsa_521, ed25519}) {
		if(to_string(t) == s) {
			return t;
		}
	}
	return unknown;
}

}
