#include "log.hpp"
#include "util/test_env.hpp"
#include "sshkit/client/auth.hpp"
#include "sshkit/client/connect.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/local_file.hpp"
#include "sshkit/services/sftp/sftp_session.hpp"
#include <catch2/catch.hpp>

namespace sshkit::test {

using namespace sftp;

namespace {

struct sftp_env : test_env {
	sftp_env(session_settings settings = {})
	: s(engine, test_log(), "127.0.0.1", port(), std::move(settings))
	{
		remote().add_dir("/data");
		remote().add_file("/data/a", "1");
		remote().add_file("/data/b", "22");
		remote().add_dir("/upload");
		password_auth(s, "user", "secret");
	}

	session s;
};

std::string test_data(std::size_t size) {
	std::string res(size, '\0');
	for(std::size_t i = 0; i != size; ++i) {
		res[i] = char(i * 31 + i / 4096);
	}
	return res;
}

}

TEST_CASE("sftp session", "[unit][sftp]") {
	sftp_env env;

	{
		sftp_session sftp(env.s);
		CHECK(sftp.is_open());
		CHECK(env.remote().called("sftp_init"));
	}
	CHECK(env.remote().count_calls("sftp_shutdown") == 1);

	{
		sftp_session sftp(env.s);
		sftp.shutdown();
		CHECK_FALSE(sftp.is_open());
		CHECK_THROWS_AS(sftp.list_dir("/data"), channel_error);
	}
	CHECK(env.remote().count_calls("sftp_shutdown") == 2);
}

TEST_CASE("sftp list dir", "[unit][sftp]") {
	sftp_env env;
	sftp_session sftp(env.s);

	auto entries = sftp.list_dir("/data");
	REQUIRE(entries.size() == 2);
	CHECK(entries[0].name == "a");
	CHECK(entries[0].size() == 1);
	CHECK(entries[1].name == "b");
	CHECK(entries[1].size() == 2);
	CHECK_FALSE(entries[0].attrs.is_directory());
	CHECK(env.remote().called("sftp_close:/data"));

	CHECK(sftp.list_dir("/upload").empty());

	CHECK_THROWS_AS(sftp.list_dir("/missing"), transfer_error);
}

TEST_CASE("sftp transfer", "[unit][sftp]") {
	sftp_env env;
	sftp_session sftp(env.s);

	SECTION("10 MiB round trip") {
		auto data = test_data(10*1024*1024);
		auto local = env.dir.write("big", data);

		CHECK(sftp.send_file(0644, local, "/upload/big") == 10485760);
		CHECK(env.remote().file_content("/upload/big") == data);
		CHECK(env.remote().files["/upload/big"].mode == 0644);

		auto back = env.dir.file("big.back");
		CHECK(sftp.receive_file(back, "/upload/big") == 10485760);
		CHECK(as_string(read_file(back)) == data);
	}

	SECTION("existing remote file is not overwritten") {
		auto local = env.dir.write("a", "new content");
		try {
			sftp.send_file(0644, local, "/data/a");
			FAIL("no exception");
		} catch(transfer_error const& e) {
			CHECK(e.code() == int(fx_file_already_exists));
		}
		CHECK(env.remote().file_content("/data/a") == "1");
		CHECK_FALSE(env.remote().called("sftp_write:"));
	}

	SECTION("missing remote file") {
		CHECK_THROWS_AS(sftp.receive_file(env.dir.file("x"), "/data/missing"), transfer_error);
	}

	SECTION("size not reported") {
		env.remote().omit_fstat_size = true;
		CHECK_THROWS_AS(sftp.receive_file(env.dir.file("x"), "/data/b"), transfer_error);
		CHECK(env.remote().called("sftp_close:/data/b"));
	}

	SECTION("missing local file") {
		CHECK_THROWS_AS(sftp.send_file(0644, env.dir.file("missing"), "/upload/x"), io_error);
		CHECK_FALSE(env.remote().called("sftp_open:"));
	}
}

TEST_CASE("sftp rename", "[unit][sftp]") {
	sftp_env env;
	sftp_session sftp(env.s);

	sftp.rename("/data/a", "/data/c");
	CHECK_FALSE(env.remote().files.contains("/data/a"));
	CHECK(env.remote().file_content("/data/c") == "1");

	// destination exists
	CHECK_THROWS_AS(sftp.rename("/data/c", "/data/b"), transfer_error);
	CHECK(env.remote().file_content("/data/b") == "22");
	CHECK(env.remote().file_content("/data/c") == "1");

	CHECK_THROWS_AS(sftp.rename("/data/missing", "/data/d"), transfer_error);
}

TEST_CASE("sftp file operations", "[unit][sftp]") {
	sftp_env env;
	sftp_session sftp(env.s);

	SECTION("directories") {
		sftp.make_dir("/data/sub");
		CHECK(sftp.stat("/data/sub").is_directory());
		CHECK_THROWS_AS(sftp.make_dir("/data/sub"), transfer_error);
		sftp.remove_dir("/data/sub");
		CHECK_THROWS_AS(sftp.stat("/data/sub"), transfer_error);
		CHECK_THROWS_AS(sftp.remove_dir("/data"), transfer_error);
	}

	SECTION("remove file") {
		sftp.remove_file("/data/a");
		CHECK_FALSE(env.remote().files.contains("/data/a"));
		CHECK_THROWS_AS(sftp.remove_file("/data/a"), transfer_error);
	}

	SECTION("handles") {
		{
			auto f = sftp.open_file("/upload/h", fxf_write | fxf_creat, 0600);
			f.write(to_span("hello"));
			CHECK(f.fstat().size == 5u);
		}
		CHECK(env.remote().called("sftp_close:/upload/h"));

		auto f = sftp.open_file("/upload/h", fxf_read);
		CHECK(as_string(f.read(3)) == "hel");
		CHECK(as_string(f.read(10)) == "lo");
		CHECK(f.read(10).empty());
		f.close();
		CHECK_FALSE(f.is_open());
		CHECK_THROWS_AS(f.read(1), transfer_error);

		auto d = sftp.open_dir("/upload");
		auto e = d.read_dir();
		REQUIRE(e);
		CHECK(e->name == "h");
		CHECK_FALSE(d.read_dir());
	}

	SECTION("stat") {
		auto attrs = sftp.stat("/data/b");
		CHECK(attrs.size == 2u);
		CHECK_FALSE(attrs.is_directory());
	}
}

TEST_CASE("sftp non-blocking", "[unit][sftp]") {
	session_settings settings;
	settings.blocking = false;
	sftp_env env(settings);
	env.remote().simulate_would_block = true;

	sftp_session sftp(env.s);
	auto data = test_data(100000);
	auto local = env.dir.write("up", data);

	CHECK(sftp.send_file(0644, local, "/upload/f") == data.size());
	auto back = env.dir.file("down");
	CHECK(sftp.receive_file(back, "/upload/f") == data.size());
	CHECK(as_string(read_file(back)) == data);

	auto entries = sftp.list_dir("/data");
	CHECK(entries.size() == 2);
	CHECK(env.remote().would_block_count > 0);
}

TEST_CASE("with_sftp", "[unit][sftp][connect]") {
	test_env env;
	env.remote().add_dir("/data");
	env.remote().add_file("/data/a", "1");
	env.remote().add_file("/data/b", "22");

	auto names = with_sftp(env.engine, test_log(), env.config(), [](sftp_session& sftp) {
			std::vector<std::string> res;
			for(auto&& e : sftp.list_dir("/data")) {
				res.push_back(e.name + ":" + std::to_string(e.size()));
			}
			return res;
		});

	CHECK(names == std::vector<std::string>{"a:1", "b:22"});
	CHECK(env.remote().called("sftp_shutdown"));
	CHECK(env.remote().called("disconnect:Done."));
}

}
