#include "client.hpp"
#include "sshkit/client/commands.hpp"
#include "sshkit/client/connect.hpp"
#include "sshkit/client/scp.hpp"

#include <iostream>

namespace sshkit {

client_commands::client_commands()
: command_parser(false)
{
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(config_file, "config", "c", "config file");
	add(host, "host", "h", "host to connect");
	add(port, "port", "p", "port to connect");
	add(username, "user", "u", "username to connect");
	add(password, "password", "", "password");
	add(public_key_file, "public-key", "", "public key file");
	add(private_key_file, "private-key", "", "private key file");
	add(passphrase, "passphrase", "", "passphrase of the private key");

	add(exec, "exec", "e", "execute command and print its output");
	add(shell, "shell", "", "run commands in interactive shell and print their output");
	add(scp_send, "scp-send", "", "send --local file to --remote path with scp");
	add(scp_receive, "scp-receive", "", "receive --remote file to --local path with scp");
	add(sftp_ls, "sftp-ls", "", "list remote directory with sftp");
	add(sftp_put, "sftp-put", "", "send --local file to --remote path with sftp");
	add(sftp_get, "sftp-get", "", "receive --remote file to --local path with sftp");
	add(sftp_rename, "sftp-rename", "", "rename remote file: <old path> <new path>");
	add(local, "local", "l", "local file path");
	add(remote, "remote", "r", "remote file path");
	add(mode, "mode", "m", "file mode for sent files in octal");

	config.add_commands(*this);
}

void client_commands::create_config(logger& log) {
	if(very_verbose) {
		log.set_level(logger::log_all);
	} else if(verbose) {
		log.set_level(logger::type(logger::error | logger::info | logger::debug));
	} else {
		log.set_level(logger::error);
	}

	config.parse(log, *this);

	std::size_t pos{};
	try {
		file_mode = std::uint32_t(std::stoul(mode, &pos, 8));
	} catch(std::exception const&) {
		pos = 0;
	}
	if(pos == 0 || pos != mode.size() || file_mode > 07777) {
		throw invalid_argument("invalid file mode '" + mode + "'");
	}

	if(sftp_rename.size() != 0 && sftp_rename.size() != 2) {
		throw invalid_argument("--sftp-rename takes old and new path");
	}
}

sshkit_client::sshkit_client(engine& e, client_commands& c, std::ostream& out)
: engine_(e)
, log_(logger::error)
, commands_(c)
, out_(out)
{
	commands_.create_config(log_);
}

void sshkit_client::require_paths(std::string_view op) const {
	if(commands_.local.empty() || commands_.remote.empty()) {
		throw invalid_argument(std::string(op) + " requires --local and --remote");
	}
}

static void print_output(std::ostream& out, const_span data) {
	out << to_string_view(data);
	out.flush();
}

int sshkit_client::run_ssh_operations(session& s) {
	int status = 0;
	if(!commands_.exec.empty()) {
		auto res = exec_command(s, commands_.exec);
		print_output(out_, res.output);
		status = res.exit_status;
	}
	if(!commands_.shell.empty()) {
		auto res = run_shell_commands(s, commands_.shell, commands_.term_type);
		for(auto&& o : res.value) {
			print_output(out_, o);
		}
		status = res.exit_status;
	}
	if(commands_.scp_send) {
		require_paths("--scp-send");
		auto n = scp_send(s, commands_.file_mode, commands_.local, commands_.remote);
		out_ << "sent " << n << " bytes\n";
	}
	if(commands_.scp_receive) {
		require_paths("--scp-receive");
		auto n = scp_receive(s, commands_.remote, commands_.local);
		out_ << "received " << n << " bytes\n";
	}

	bool const need_sftp = commands_.sftp_ls || commands_.sftp_put || commands_.sftp_get || !commands_.sftp_rename.empty();
	if(need_sftp) {
		sftp::sftp_session sftp(s);
		if(commands_.sftp_ls) {
			auto path = commands_.sftp_ls->empty() ? std::string(".") : *commands_.sftp_ls;
			for(auto&& e : sftp.list_dir(path)) {
				out_ << e.name << " " << e.size() << "\n";
			}
		}
		if(commands_.sftp_put) {
			require_paths("--sftp-put");
			auto n = sftp.send_file(commands_.file_mode, commands_.local, commands_.remote);
			out_ << "sent " << n << " bytes\n";
		}
		if(commands_.sftp_get) {
			require_paths("--sftp-get");
			auto n = sftp.receive_file(commands_.local, commands_.remote);
			out_ << "received " << n << " bytes\n";
		}
		if(!commands_.sftp_rename.empty()) {
			sftp.rename(commands_.sftp_rename[0], commands_.sftp_rename[1]);
		}
		sftp.shutdown();
	}
	return status;
}

int sshkit_client::run() {
	return with_ssh(engine_, log_, commands_, [&](session& s) {
			return run_ssh_operations(s);
		});
}

}
