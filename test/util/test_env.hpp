#ifndef SSHKIT_TEST_ENV_HEADER
#define SSHKIT_TEST_ENV_HEADER

#include "fake_engine.hpp"
#include "local_listener.hpp"
#include "sshkit/client/client_config.hpp"

#include <filesystem>

namespace sshkit::test {

/// directory under the system temp directory that is removed with its content when destroyed
class temp_dir {
public:
	temp_dir();
	~temp_dir();

	temp_dir(temp_dir const&) = delete;
	temp_dir& operator=(temp_dir const&) = delete;

	std::filesystem::path const& path() const { return path_; }

	/// full path of name inside the directory
	std::string file(std::string_view name) const;

	/// create file with content, returns full path
	std::string write(std::string_view name, std::string_view content) const;

private:
	std::filesystem::path path_;
};

/// fake remote host behind a real local tcp port
struct test_env {
	local_listener listener;
	fake_engine engine;
	temp_dir dir;

	fake_remote& remote() { return engine.remote; }
	std::uint16_t port() const { return listener.port(); }

	/// 127.0.0.1:port with password "secret" for "user", no known_hosts check
	client_config config() const;
};

std::string as_string(byte_vector const&);

}

#endif
