#ifndef SSHKIT_CLIENT_KNOWN_HOSTS_HEADER
#define SSHKIT_CLIENT_KNOWN_HOSTS_HEADER

#include "sshkit/engine/engine.hpp"

#include <vector>

namespace sshkit {

class session;

enum class known_host_result {
	match,     // entry for the host exists with identical key
	mismatch,  // entry for the host exists with different key, the connection must be aborted
	not_found, // no entry for the host
	failure    // could not compare (e.g. no host key available)
};
std::string_view to_string(known_host_result);

struct host_pattern {
	std::string name;
	bool negated{};
	// hashed entries (|1|salt|hash) store HMAC-SHA1(salt, name)
	bool hashed{};
	byte_vector salt;
	byte_vector hash;

	bool matches(std::string_view host_form) const;
};

struct known_host_entry {
	enum class marker_type {
		none,
		revoked,
		cert_authority
	};

	marker_type marker{marker_type::none};
	std::vector<host_pattern> hosts;
	std::string key_type_name;
	host_key_type key_type{host_key_type::unknown};
	byte_vector key;
	std::string comment;

	bool matches_host(std::string_view host_form) const;
};

/** \brief In-memory copy of an OpenSSH known_hosts file
 */
class known_hosts {
public:
	/// throws io_error if the file cannot be read, malformed lines are skipped
	static known_hosts load(std::string const& path, logger&);

	/// parse known_hosts content, malformed lines are skipped
	static known_hosts parse(std::string_view content, logger&);

	/// exact match on host string and port, port 22 entries are plain host names, others "[host]:port"
	known_host_result check(std::string_view host, std::uint16_t port, const_span key) const;

	std::size_t size() const { return entries_.size(); }
	std::vector<known_host_entry> const& entries() const { return entries_; }
	std::string const& path() const { return path_; }

private:
	std::string path_;
	std::vector<known_host_entry> entries_;
};

/// the name used in known_hosts for host and port
std::string host_form(std::string_view host, std::uint16_t port);

/// line for known_hosts file: "<host form> <key type> <base64 key>"
std::string known_hosts_line(std::string_view host, std::uint16_t port, host_key const&);

/// OpenSSH style fingerprint "SHA256:<base64 of sha256 of the key blob>"
std::string host_key_fingerprint(const_span key);

/** \brief Compare the host key presented in the handshake to the known_hosts file
 *
 *  The file is loaded for the check and released before returning. Throws io_error if the file cannot be read.
 *  A mismatch is returned as value, the caller must abort the connection on it.
 */
known_host_result check_host(session&, std::string_view host, std::uint16_t port, std::string const& known_hosts_path);

}

#endif
