#include "log.hpp"
#include "util/test_env.hpp"
#include "sshkit/client/auth.hpp"
#include "sshkit/client/channel.hpp"
#include "sshkit/client/commands.hpp"
#include "sshkit/common/errors.hpp"
#include <catch2/catch.hpp>

namespace sshkit::test {

namespace {

struct channel_env : test_env {
	channel_env(session_settings settings = {})
	: s(engine, test_log(), "127.0.0.1", port(), std::move(settings))
	{
		password_auth(s, "user", "secret");
	}

	session s;
};

session_settings non_blocking() {
	session_settings settings;
	settings.blocking = false;
	return settings;
}

std::string long_output() {
	std::string res;
	for(int i = 0; i != 2000; ++i) {
		res += "line " + std::to_string(i) + "\n";
	}
	return res;
}

}

TEST_CASE("exec command", "[unit][channel]") {
	channel_env env;

	auto res = exec_command(env.s, "echo hello");
	CHECK(as_string(res.output) == "hello\n");
	CHECK(res.exit_status == 0);

	res = exec_command(env.s, "exit 3");
	CHECK(res.output.empty());
	CHECK(res.exit_status == 3);

	res = exec_command(env.s, "no-such-command");
	CHECK(as_string(res.output) == "no-such-command: command not found\n");
	CHECK(res.exit_status == 127);

	// every channel is closed and freed
	CHECK(env.remote().count_calls("open_session") == 3);
	CHECK(env.remote().count_calls("channel_close") == 3);
	CHECK(env.remote().count_calls("channel_free") == 3);
}

TEST_CASE("exec commands", "[unit][channel]") {
	channel_env env;

	auto res = exec_commands(env.s, {"echo a", "exit 2", "echo b"});
	REQUIRE(res.size() == 3);
	CHECK(as_string(res[0].output) == "a\n");
	CHECK(res[1].exit_status == 2);
	CHECK(as_string(res[2].output) == "b\n");
	CHECK(env.remote().count_calls("open_session") == 3);
}

TEST_CASE("channel state", "[unit][channel]") {
	channel_env env;

	auto ch = channel::open_session(env.s);
	CHECK(ch.state() == channel_state::open);

	SECTION("pty is only allowed before exec") {
		ch.request_pty("xterm");
		CHECK(ch.state() == channel_state::pty_allocated);
		ch.execute("echo x");
		CHECK(ch.state() == channel_state::running);
		CHECK_THROWS_AS(ch.request_pty("xterm"), channel_error);
		CHECK_THROWS_AS(ch.execute("echo y"), channel_error);
		CHECK_THROWS_AS(ch.start_shell(), channel_error);
	}

	SECTION("exit status only after close") {
		ch.execute("exit 5");
		CHECK_THROWS_AS(ch.exit_status(), channel_error);
		CHECK(ch.read_all().empty());
		ch.close();
		CHECK(ch.state() == channel_state::closed);
		CHECK(ch.exit_status() == 5);
		CHECK(ch.eof());
	}

	SECTION("no io after close") {
		ch.execute("echo x");
		ch.close();
		CHECK_THROWS_AS(ch.read(10), channel_error);
		CHECK_THROWS_AS(ch.write(to_span("x")), channel_error);
		CHECK_THROWS_AS(ch.send_eof(), channel_error);
		// closing again does nothing
		ch.close();
		CHECK(env.remote().count_calls("channel_close") == 1);
	}

	SECTION("no write after eof") {
		ch.execute("cat");
		ch.send_eof();
		CHECK(ch.state() == channel_state::eof_sent);
		CHECK_THROWS_AS(ch.write(to_span("x")), channel_error);
		CHECK_THROWS_AS(ch.send_eof(), channel_error);
		CHECK(ch.read_all().empty());
	}

	SECTION("destructor closes") {
		{
			auto other = channel::open_session(env.s);
			other.execute("echo x");
		}
		CHECK(env.remote().count_calls("channel_close") == 1);
		CHECK(env.remote().count_calls("channel_free") == 1);
	}

	CHECK(to_string(channel_state::eof_sent) == "eof_sent");
}

TEST_CASE("with_channel", "[unit][channel]") {
	channel_env env;

	SECTION("result and exit status") {
		auto res = with_channel(env.s, [](channel& ch) {
				ch.execute("echo value");
				return as_string(ch.read_all());
			});
		CHECK(res.value == "value\n");
		CHECK(res.exit_status == 0);
	}

	SECTION("channel is freed when the action throws") {
		CHECK_THROWS_AS(with_channel(env.s, [](channel&) -> int {
				throw std::runtime_error("action failed");
			}), std::runtime_error);
		CHECK(env.remote().count_calls("channel_close") == 1);
		CHECK(env.remote().count_calls("channel_free") == 1);
	}

	SECTION("open fails without authentication") {
		session other(env.engine, test_log(), "127.0.0.1", env.port());
		CHECK_THROWS_AS(channel::open_session(other), channel_error);
	}
}

TEST_CASE("read all in chunks", "[unit][channel]") {
	std::string const expected = long_output();

	SECTION("blocking") {
		channel_env env;
		env.remote().max_io_size = 100;
		env.remote().handler = [&](std::string_view) { return command_reply{expected, 0}; };

		auto res = exec_command(env.s, "generate");
		CHECK(as_string(res.output) == expected);
	}

	SECTION("non-blocking gives same result as blocking") {
		channel_env env(non_blocking());
		env.remote().max_io_size = 100;
		env.remote().simulate_would_block = true;
		env.remote().handler = [&](std::string_view) { return command_reply{expected, 0}; };

		auto res = exec_command(env.s, "generate");
		CHECK(as_string(res.output) == expected);
		CHECK(res.exit_status == 0);
		CHECK(env.remote().would_block_count > 0);
	}

	SECTION("switching to non-blocking after connecting") {
		channel_env env;
		env.s.set_blocking(false);
		env.remote().simulate_would_block = true;
		env.remote().handler = [&](std::string_view) { return command_reply{expected, 0}; };

		CHECK(as_string(exec_command(env.s, "generate").output) == expected);
	}
}

TEST_CASE("non-blocking read", "[unit][channel]") {
	channel_env env(non_blocking());

	auto ch = channel::open_session(env.s);
	ch.request_pty("linux");
	ch.start_shell();

	CHECK(ch.poll_read(std::chrono::milliseconds(0)));
	auto greeting = ch.read_all_nonblocking(std::chrono::milliseconds(10));
	CHECK(as_string(greeting) == env.remote().shell_greeting);

	// nothing more to read and no eof
	CHECK_FALSE(ch.read(1024));
	CHECK_FALSE(ch.eof());
	CHECK_FALSE(ch.poll_read(std::chrono::milliseconds(0)));

	ch.write_all(to_span("echo hi\n"));
	auto data = ch.read(1024);
	REQUIRE(data);
	CHECK(as_string(*data) == "hi\n$ ");

	ch.send_eof();
	auto end = ch.read(1024);
	REQUIRE(end);
	CHECK(end->empty());
	CHECK(ch.eof());
}

TEST_CASE("write in chunks", "[unit][channel]") {
	session_settings settings;
	settings.write_chunk_size = 16;
	channel_env env(settings);
	env.remote().max_io_size = 5;

	auto ch = channel::open_session(env.s);
	ch.start_shell();
	CHECK(ch.write(to_span("echo abcdefghijklmnopqrstuvwxyz\n")) == 32);
	ch.send_eof();
	auto out = as_string(ch.read_all());
	CHECK(out == env.remote().shell_greeting + "abcdefghijklmnopqrstuvwxyz\n$ ");
}

TEST_CASE("run shell commands", "[unit][channel]") {
	channel_env env;

	auto res = run_shell_commands(env.s, {"echo one", "echo two"});
	REQUIRE(res.value.size() == 2);
	CHECK(as_string(res.value[0]) == "one\n$ ");
	CHECK(as_string(res.value[1]) == "two\n$ ");
	CHECK(res.exit_status == 0);

	CHECK(env.remote().called("pty:linux"));
	CHECK(env.remote().called("shell"));
	CHECK(env.remote().called("send_eof"));
	CHECK(env.remote().count_calls("channel_free") == 1);
}

TEST_CASE("run shell commands non-blocking", "[unit][channel]") {
	channel_env env(non_blocking());
	env.remote().simulate_would_block = true;
	env.remote().max_io_size = 3;

	auto res = run_shell_commands(env.s, {"echo first", "echo second"}, "vt100");
	REQUIRE(res.value.size() == 2);
	CHECK(as_string(res.value[0]) == "first\n$ ");
	CHECK(as_string(res.value[1]) == "second\n$ ");
	CHECK(env.remote().called("pty:vt100"));
}

TEST_CASE("shell output without data after wakeup", "[unit][channel]") {
	channel_env env;
	auto ch = channel::open_session(env.s);
	ch.request_pty("linux");
	ch.start_shell();
	CHECK(as_string(ch.read_all_nonblocking()) == env.remote().shell_greeting);

	// the socket becomes readable but nothing arrives for this channel
	env.remote().spurious_wakeups = 2;
	CHECK(ch.read_all_nonblocking(std::chrono::milliseconds(10)).empty());
	CHECK(env.remote().spurious_wakeups == 0);

	// the session mode is restored
	CHECK(env.s.blocking());
	CHECK(env.remote().calls.back() == "set_blocking:1");

	ch.write_all("echo after\n");
	CHECK(as_string(ch.read_all_nonblocking()) == "after\n$ ");
}

}
