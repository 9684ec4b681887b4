#include "log.hpp"
#include "util/test_env.hpp"
#include "sshkit/client/auth.hpp"
#include "sshkit/client/scp.hpp"
#include "sshkit/client/session.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/local_file.hpp"
#include <catch2/catch.hpp>

#include <algorithm>

namespace sshkit::test {

namespace {

std::string test_data(std::size_t size) {
	std::string res(size, '\0');
	for(std::size_t i = 0; i != size; ++i) {
		res[i] = char('a' + (i * 7) % 26);
	}
	return res;
}

}

TEST_CASE("scp send", "[unit][scp]") {
	test_env env;
	env.remote().add_dir("/tmp");
	session s(env.engine, test_log(), "127.0.0.1", env.port());
	password_auth(s, "user", "secret");

	SECTION("file content and mode") {
		auto data = test_data(100000);
		auto local = env.dir.write("upload", data);

		CHECK(scp_send(s, 0600, local, "/tmp/upload") == data.size());
		CHECK(env.remote().file_content("/tmp/upload") == data);
		CHECK(env.remote().files["/tmp/upload"].mode == 0600);

		// eof is sent and acknowledged before the channel closes
		auto const& calls = env.remote().calls;
		auto eof = std::find(calls.begin(), calls.end(), "send_eof");
		auto wait = std::find(calls.begin(), calls.end(), "wait_eof");
		auto close = std::find(calls.begin(), calls.end(), "channel_close");
		CHECK(eof < wait);
		CHECK(wait < close);
		CHECK(close != calls.end());
	}

	SECTION("empty file") {
		auto local = env.dir.write("empty", "");
		CHECK(scp_send(s, 0644, local, "/tmp/empty") == 0);
		CHECK(env.remote().files.contains("/tmp/empty"));
	}

	SECTION("missing local file fails before opening channel") {
		CHECK_THROWS_AS(scp_send(s, 0644, env.dir.file("missing"), "/tmp/x"), io_error);
		CHECK_FALSE(env.remote().called("scp_send:"));
	}

	SECTION("missing remote directory") {
		auto local = env.dir.write("f", "data");
		CHECK_THROWS_AS(scp_send(s, 0644, local, "/no/such/dir/f"), channel_error);
	}
}

TEST_CASE("scp receive", "[unit][scp]") {
	test_env env;
	auto data = test_data(50000);
	env.remote().add_file("/data.bin", data, 0640);
	session s(env.engine, test_log(), "127.0.0.1", env.port());
	password_auth(s, "user", "secret");

	SECTION("reads exactly the declared size") {
		auto local = env.dir.file("data.bin");
		CHECK(scp_receive(s, "/data.bin", local) == data.size());
		CHECK(as_string(read_file(local)) == data);
		CHECK(env.remote().count_calls("channel_free") == 1);
	}

	SECTION("premature end of data") {
		env.remote().scp_extra_size = 10;
		CHECK_THROWS_AS(scp_receive(s, "/data.bin", env.dir.file("data.bin")), transfer_error);
		CHECK(env.remote().count_calls("channel_free") == 1);
	}

	SECTION("missing remote file") {
		CHECK_THROWS_AS(scp_receive(s, "/missing", env.dir.file("x")), channel_error);
	}
}

TEST_CASE("scp round trip non-blocking", "[unit][scp]") {
	test_env env;
	env.remote().add_dir("/tmp");
	session_settings settings;
	settings.blocking = false;
	session s(env.engine, test_log(), "127.0.0.1", env.port(), settings);
	password_auth(s, "user", "secret");

	env.remote().simulate_would_block = true;
	env.remote().max_io_size = 1000;

	auto data = test_data(12345);
	auto local = env.dir.write("up", data);
	CHECK(scp_send(s, 0644, local, "/tmp/f") == data.size());

	auto back = env.dir.file("down");
	CHECK(scp_receive(s, "/tmp/f", back) == data.size());
	CHECK(as_string(read_file(back)) == data);
	CHECK(env.remote().would_block_count > 0);
}

}
