#ifndef SSHKIT_CLIENT_COMMANDS_HEADER
#define SSHKIT_CLIENT_COMMANDS_HEADER

#include "channel.hpp"

#include <vector>

namespace sshkit {

struct command_output {
	int exit_status{};
	/// stdout of the command
	byte_vector output;
};

/// run command on its own channel and read all output
command_output exec_command(session&, std::string_view command);

/// run each command on its own channel, in order
std::vector<command_output> exec_commands(session&, std::vector<std::string> const& commands);

/** \brief Run commands in an interactive shell
 *
 *  Requests a pty with the given terminal type, starts the shell and discards the greeting, then writes each
 *  command followed by newline and collects what arrives until the idle timeout of the session settings.
 *  Returns the output of each command and the exit status of the shell.
 */
channel_result<std::vector<byte_vector>> run_shell_commands(session&, std::vector<std::string> const& commands, std::string_view term = "linux");

}

#endif
