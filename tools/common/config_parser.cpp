#include "config_parser.hpp"

#include <filesystem>

namespace sshkit {

void config_parser::add_commands(command_parser& p) {
	p.add(known_hosts_, "known-hosts", "", "known_hosts file to verify the host key against");
	p.add(strict_host_key_checking_, "strict-host-key-checking", "", "Reject hosts that are not in known_hosts file");
	p.add(blocking_, "blocking", "", "Use blocking mode for the session");
	p.add(read_chunk_size_, "read-chunk-size", "", "Size of single read from channel in bytes");
	p.add(write_chunk_size_, "write-chunk-size", "", "Maximum size of single write to channel in bytes");
	p.add(idle_timeout_, "idle-timeout", "", "Time to wait for more shell output in milliseconds");
	p.add(term_, "term", "", "Terminal type for pty");
	p.add(disconnect_reason_, "disconnect-reason", "", "Reason sent to the server when disconnecting");
}

void config_parser::parse(logger& log, client_config& c) {
	if(c.host.empty()) {
		throw invalid_argument("no host given");
	}
	if(c.port == 0) {
		throw invalid_argument("invalid port 0");
	}
	if(c.username.empty()) {
		throw invalid_argument("no user given");
	}
	if(!c.public_key_file.empty() && c.private_key_file.empty()) {
		throw invalid_argument("public key given without private key");
	}

	if(!known_hosts_.empty()) {
		if(!std::filesystem::is_regular_file(known_hosts_)) {
			throw invalid_argument("known_hosts file '" + known_hosts_ + "' does not exist or is not a file");
		}
		c.known_hosts_file = known_hosts_;
	}
	if(strict_host_key_checking_) {
		if(*strict_host_key_checking_ && c.known_hosts_file.empty()) {
			throw invalid_argument("strict host key checking requires known_hosts file");
		}
		c.allow_unknown_host = !*strict_host_key_checking_;
	}
	if(blocking_) {
		c.session.blocking = *blocking_;
	}
	if(read_chunk_size_) {
		c.session.read_chunk_size = read_chunk_size_;
	}
	if(write_chunk_size_) {
		c.session.write_chunk_size = write_chunk_size_;
	}
	if(idle_timeout_.count() < 0) {
		throw invalid_argument("negative idle timeout");
	}
	if(idle_timeout_.count()) {
		c.session.idle_timeout = idle_timeout_;
	}
	if(!term_.empty()) {
		c.term_type = term_;
	}
	if(!disconnect_reason_.empty()) {
		c.session.disconnect_reason = disconnect_reason_;
	}

	log.log(logger::debug, "client config [host={}, port={}, user={}, blocking={}, known_hosts={}]",
		c.host, c.port, c.username, c.session.blocking, c.known_hosts_file);
}

}
