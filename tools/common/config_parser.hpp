#ifndef SSHKIT_TOOLS_COMMON_CONFIG_PARSER_HEADER
#define SSHKIT_TOOLS_COMMON_CONFIG_PARSER_HEADER

#include "command_parser.hpp"
#include "sshkit/client/client_config.hpp"
#include "sshkit/common/logger.hpp"

namespace sshkit {

/// options for client_config that are validated before use
class config_parser {
public:
	/// add client_config options to the command parser
	void add_commands(command_parser&);

	/// throws invalid_argument if some of the options contain invalid value
	void parse(logger&, client_config&);

private:
	std::string known_hosts_;
	std::optional<bool> strict_host_key_checking_;
	std::optional<bool> blocking_;
	std::uint32_t read_chunk_size_{};
	std::uint32_t write_chunk_size_{};
	std::chrono::milliseconds idle_timeout_{};
	std::string term_;
	std::string disconnect_reason_;
};

}

#endif
