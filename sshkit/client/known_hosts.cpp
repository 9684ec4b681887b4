#include "known_hosts.hpp"
#include "session.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/util.hpp"

#include <nettle/hmac.h>
#include <nettle/sha1.h>
#include <nettle/sha2.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sshkit {

std::string_view to_string(known_host_result r) {
	using enum known_host_result;
	switch(r) {
		case match:     return "match";
		case mismatch:  return "mismatch";
		case not_found: return "not_found";
		case failure:   return "failure";
	}
	return "unknown";
}

static byte_vector hmac_sha1(const_span key, std::string_view data) {
	hmac_sha1_ctx ctx;
	nettle_hmac_sha1_set_key(&ctx, key.size(), to_uint8_ptr(key));
	nettle_hmac_sha1_update(&ctx, data.size(), (std::uint8_t const*)data.data());
	byte_vector out(SHA1_DIGEST_SIZE);
	nettle_hmac_sha1_digest(&ctx, out.size(), to_uint8_ptr(out));
	return out;
}

bool host_pattern::matches(std::string_view host_form) const {
	if(hashed) {
		return hmac_sha1(salt, host_form) == hash;
	}
	return name == host_form;
}

bool known_host_entry::matches_host(std::string_view host_form) const {
	bool found = false;
	for(auto&& p : hosts) {
		if(p.matches(host_form)) {
			if(p.negated) {
				return false;
			}
			found = true;
		}
	}
	return found;
}

std::string host_form(std::string_view host, std::uint16_t port) {
	if(port == 22) {
		return std::string(host);
	}
	return "[" + std::string(host) + "]:" + std::to_string(port);
}

std::string known_hosts_line(std::string_view host, std::uint16_t port, host_key const& key) {
	return host_form(host, port) + " " + std::string(to_string(key.type)) + " " + encode_base64(key.data, true);
}

std::string host_key_fingerprint(const_span key) {
	sha256_ctx ctx;
	nettle_sha256_init(&ctx);
	nettle_sha256_update(&ctx, key.size(), to_uint8_ptr(key));
	byte_vector digest(SHA256_DIGEST_SIZE);
	nettle_sha256_digest(&ctx, digest.size(), to_uint8_ptr(digest));
	return "SHA256:" + encode_base64(digest);
}

static std::optional<host_pattern> parse_pattern(std::string_view s) {
	host_pattern p;
	if(!s.empty() && s.front() == '!') {
		p.negated = true;
		s.remove_prefix(1);
	}
	if(s.starts_with("|1|")) {
		// |1|<base64 salt>|<base64 hash>
		auto parts = split(s.substr(3), '|');
		if(parts.size() != 2) {
			return std::nullopt;
		}
		p.hashed = true;
		p.salt = decode_base64(parts[0]);
		p.hash = decode_base64(parts[1]);
		if(p.salt.empty() || p.hash.size() != SHA1_DIGEST_SIZE) {
			return std::nullopt;
		}
	} else if(s.empty()) {
		return std::nullopt;
	}
	p.name = std::string(s);
	return p;
}

static std::optional<known_host_entry> parse_line(std::string_view line) {
	std::vector<std::string_view> fields;
	std::string_view::size_type pos = 0;
	while(pos < line.size()) {
		auto b = line.find_first_not_of(" \t", pos);
		if(b == std::string_view::npos) {
			break;
		}
		auto e = line.find_first_of(" \t", b);
		if(e == std::string_view::npos) {
			e = line.size();
		}
		fields.push_back(line.substr(b, e-b));
		pos = e;
	}

	known_host_entry entry;
	std::size_t i = 0;
	if(!fields.empty() && fields[0].starts_with("@")) {
		if(fields[0] == "@revoked") {
			entry.marker = known_host_entry::marker_type::revoked;
		} else if(fields[0] == "@cert-authority") {
			entry.marker = known_host_entry::marker_type::cert_authority;
		} else {
			return std::nullopt;
		}
		++i;
	}

	if(fields.size() < i+3) {
		return std::nullopt;
	}

	for(auto&& h : split(fields[i], ',')) {
		auto p = parse_pattern(h);
		if(!p) {
			return std::nullopt;
		}
		entry.hosts.push_back(std::move(*p));
	}

	entry.key_type_name = std::string(fields[i+1]);
	entry.key_type = host_key_type_from_string(entry.key_type_name);
	entry.key = decode_base64(fields[i+2]);
	if(entry.key.empty()) {
		return std::nullopt;
	}

	for(auto c = i+3; c < fields.size(); ++c) {
		if(!entry.comment.empty()) {
			entry.comment += ' ';
		}
		entry.comment += fields[c];
	}

	return entry;
}

known_hosts known_hosts::parse(std::string_view content, logger& log) {
	known_hosts res;
	std::size_t line_number = 0;
	for(auto l : split(content, '\n')) {
		++line_number;
		auto line = trim(l);
		if(line.empty() || line.front() == '#') {
			continue;
		}
		auto entry = parse_line(line);
		if(entry) {
			res.entries_.push_back(std::move(*entry));
		} else {
			log.log(logger::debug, "skipping malformed known_hosts line {}", line_number);
		}
	}
	return res;
}

known_hosts known_hosts::load(std::string const& path, logger& log) {
	std::error_code ec;
	if(!std::filesystem::is_regular_file(path, ec)) {
		auto reason = ec ? ec.message() : std::string("not a regular file");
		log.log(logger::error, "Cannot use {} as known_hosts file: {}", path, reason);
		throw io_error("failed to read known_hosts file '" + path + "': " + reason, ec.value());
	}

	std::ifstream in(path, std::ios_base::binary);
	if(!in) {
		int err = errno;
		throw io_error("failed to read known_hosts file '" + path + "': " + std::strerror(err), err);
	}
	std::ostringstream content;
	// an empty file sets failbit on content as well
	if(in.peek() != std::ifstream::traits_type::eof()) {
		content << in.rdbuf();
	}
	if(in.bad() || content.fail()) {
		throw io_error("failed to read known_hosts file '" + path + "'");
	}

	auto res = parse(content.str(), log);
	res.path_ = path;
	log.log(logger::debug_trace, "loaded {} entries from {}", res.size(), path);
	return res;
}

known_host_result known_hosts::check(std::string_view host, std::uint16_t port, const_span key) const {
	if(key.empty()) {
		return known_host_result::failure;
	}

	auto form = host_form(host, port);
	bool found = false;
	bool matched = false;

	for(auto&& e : entries_) {
		if(e.marker == known_host_entry::marker_type::cert_authority || !e.matches_host(form)) {
			continue;
		}

		bool same_key = std::ranges::equal(e.key, key);
		if(e.marker == known_host_entry::marker_type::revoked) {
			if(same_key) {
				return known_host_result::mismatch;
			}
			continue;
		}

		found = true;
		matched = matched || same_key;
	}

	if(matched) {
		return known_host_result::match;
	}
	return found ? known_host_result::mismatch : known_host_result::not_found;
}

known_host_result check_host(session& s, std::string_view host, std::uint16_t port, std::string const& known_hosts_path) {
	auto& log = s.log();
	auto kh = known_hosts::load(known_hosts_path, log);

	auto key = s.backend().get_host_key();
	if(!key || key->data.empty()) {
		log.log(logger::error, "No host key available from the session");
		return known_host_result::failure;
	}

	auto res = kh.check(host, port, key->data);
	auto fp = host_key_fingerprint(key->data);
	if(res == known_host_result::mismatch) {
		log.log(logger::error, "Host key for {} does not match known_hosts [type={}, fingerprint={}]", host_form(host, port), to_string(key->type), fp);
	} else {
		log.log(logger::info, "Host key check for {}: {} [type={}, fingerprint={}]", host_form(host, port), to_string(res), to_string(key->type), fp);
	}
	return res;
}

}
