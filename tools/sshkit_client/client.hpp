#ifndef SSHKIT_TOOLS_CLIENT_HEADER
#define SSHKIT_TOOLS_CLIENT_HEADER

#include "tools/common/config_parser.hpp"
#include "sshkit/client/client_config.hpp"
#include "sshkit/engine/engine.hpp"

#include <iosfwd>

namespace sshkit {

class session;

struct client_commands : client_config, command_parser {
	bool help{};
	bool verbose{};
	bool very_verbose{};
	std::string config_file;

	// operations, run in this order
	std::string exec;
	std::vector<std::string> shell;
	bool scp_send{};
	bool scp_receive{};
	std::optional<std::string> sftp_ls;
	bool sftp_put{};
	bool sftp_get{};
	std::vector<std::string> sftp_rename;

	std::string local;
	std::string remote;
	/// octal, e.g. 0600
	std::string mode{"0644"};
	std::uint32_t file_mode{0644};

	config_parser config;

	client_commands();
	void create_config(logger& log);
};

class sshkit_client {
public:
	sshkit_client(engine&, client_commands&, std::ostream& out);

	/// returns the exit status of the last executed command or 0
	int run();

private:
	void require_paths(std::string_view op) const;
	int run_ssh_operations(session&);

private:
	engine& engine_;
	stdout_logger log_;
	client_commands& commands_;
	std::ostream& out_;
};

}

#endif
