#include "commands.hpp"

namespace sshkit {

command_output exec_command(session& s, std::string_view command) {
	auto res = with_channel(s, [&](channel& ch) {
			ch.execute(command);
			return ch.read_all();
		});

	s.log().log(logger::debug, "command finished [exit status={}, output={} bytes]", res.exit_status, res.value.size());
	return command_output{res.exit_status, std::move(res.value)};
}

std::vector<command_output> exec_commands(session& s, std::vector<std::string> const& commands) {
	std::vector<command_output> res;
	res.reserve(commands.size());
	for(auto&& c : commands) {
		res.push_back(exec_command(s, c));
	}
	return res;
}

channel_result<std::vector<byte_vector>> run_shell_commands(session& s, std::vector<std::string> const& commands, std::string_view term) {
	return with_channel(s, [&](channel& ch) {
			ch.request_pty(term);
			ch.start_shell();

			auto greeting = ch.read_all_nonblocking();
			s.log().log(logger::debug_trace, "shell greeting {} bytes", greeting.size());

			std::vector<byte_vector> outputs;
			outputs.reserve(commands.size());
			for(auto&& c : commands) {
				ch.write_all(c + "\n");
				outputs.push_back(ch.read_all_nonblocking());
			}

			ch.send_eof();
			return outputs;
		});
}

}
