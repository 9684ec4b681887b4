#include "libssh2_engine.hpp"
#include "sshkit/common/errors.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <poll.h>

#include <cerrno>
#include <string>

namespace sshkit {
namespace {

engine_status to_status(long rc) {
	if(rc >= 0) {
		return engine_status::ok;
	}
	return rc == LIBSSH2_ERROR_EAGAIN ? engine_status::would_block : engine_status::error;
}

io_result to_io_result(ssize_t rc) {
	if(rc >= 0) {
		return io_result{engine_status::ok, std::size_t(rc)};
	}
	return io_result{to_status(rc), 0};
}

// functions returning pointers report EAGAIN via the session error
engine_status null_status(LIBSSH2_SESSION* s) {
	return libssh2_session_last_errno(s) == LIBSSH2_ERROR_EAGAIN ? engine_status::would_block : engine_status::error;
}

host_key_type from_libssh2_key_type(int t) {
	switch(t) {
		case LIBSSH2_HOSTKEY_TYPE_RSA:       return host_key_type::rsa;
		case LIBSSH2_HOSTKEY_TYPE_DSS:       return host_key_type::dss;
		case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return host_key_type::ecdsa_256;
		case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return host_key_type::ecdsa_384;
		case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return host_key_type::ecdsa_521;
		case LIBSSH2_HOSTKEY_TYPE_ED25519:   return host_key_type::ed25519;
	}
	return host_key_type::unknown;
}

unsigned long to_libssh2_flags(sftp::open_mode m) {
	unsigned long res = 0;
	if(m & sftp::fxf_read)   res |= LIBSSH2_FXF_READ;
	if(m & sftp::fxf_write)  res |= LIBSSH2_FXF_WRITE;
	if(m & sftp::fxf_append) res |= LIBSSH2_FXF_APPEND;
	if(m & sftp::fxf_creat)  res |= LIBSSH2_FXF_CREAT;
	if(m & sftp::fxf_trunc)  res |= LIBSSH2_FXF_TRUNC;
	if(m & sftp::fxf_excl)   res |= LIBSSH2_FXF_EXCL;
	return res;
}

long to_libssh2_rename_flags(sftp::rename_flags f) {
	long res = 0;
	if(f & sftp::rename_overwrite) res |= LIBSSH2_SFTP_RENAME_OVERWRITE;
	if(f & sftp::rename_atomic)    res |= LIBSSH2_SFTP_RENAME_ATOMIC;
	if(f & sftp::rename_native)    res |= LIBSSH2_SFTP_RENAME_NATIVE;
	return res;
}

sftp::file_attributes from_libssh2_attrs(LIBSSH2_SFTP_ATTRIBUTES const& a) {
	sftp::file_attributes res;
	if(a.flags & LIBSSH2_SFTP_ATTR_SIZE) {
		res.size = a.filesize;
	}
	if(a.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
		res.uid = std::uint32_t(a.uid);
		res.gid = std::uint32_t(a.gid);
	}
	if(a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
		res.permissions = std::uint32_t(a.permissions);
	}
	if(a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
		res.atime = std::uint32_t(a.atime);
		res.mtime = std::uint32_t(a.mtime);
	}
	return res;
}

// waits on the session socket in the direction libssh2 is blocked on
struct socket_waiter {
	LIBSSH2_SESSION* session{};
	native_socket socket{-1};
	logger* log{};

	bool operator()(std::chrono::milliseconds timeout) const {
		if(socket < 0) {
			return false;
		}

		int dir = libssh2_session_block_directions(session);
		pollfd pfd{};
		pfd.fd = socket;
		if(dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
			pfd.events |= POLLOUT;
		}
		if((dir & LIBSSH2_SESSION_BLOCK_INBOUND) || !pfd.events) {
			pfd.events |= POLLIN;
		}

		int rc;
		do {
			rc = ::poll(&pfd, 1, timeout.count() < 0 ? -1 : int(timeout.count()));
		} while(rc < 0 && errno == EINTR);

		if(rc < 0 && log) {
			log->log(logger::error, "poll failed on ssh socket [errno={}]", errno);
		}
		return rc > 0;
	}

	// for destructors, which cannot report would_block to the caller
	void complete(auto&& op) const {
		auto res = complete_with_wait(
			[&]{ return to_status(op()); },
			[&]{ (*this)(infinite_wait); });
		if(res != engine_status::ok && log) {
			log->log(logger::debug, "libssh2 release failed [code={}]", libssh2_session_last_errno(session));
		}
	}
};

class libssh2_channel : public channel_backend {
public:
	libssh2_channel(LIBSSH2_CHANNEL* ch)
	: channel_(ch)
	{}

	~libssh2_channel() {
		libssh2_channel_free(channel_);
	}

	engine_status request_pty(std::string_view term) override {
		return to_status(libssh2_channel_request_pty_ex(channel_, term.data(), unsigned(term.size()), nullptr, 0,
			LIBSSH2_TERM_WIDTH, LIBSSH2_TERM_HEIGHT, LIBSSH2_TERM_WIDTH_PX, LIBSSH2_TERM_HEIGHT_PX));
	}

	engine_status exec(std::string_view command) override {
		return to_status(libssh2_channel_process_startup(channel_, "exec", 4, command.data(), unsigned(command.size())));
	}

	engine_status shell() override {
		return to_status(libssh2_channel_process_startup(channel_, "shell", 5, nullptr, 0));
	}

	io_result read(span buffer) override {
		return to_io_result(libssh2_channel_read_ex(channel_, 0, (char*)buffer.data(), buffer.size()));
	}

	io_result write(const_span data) override {
		return to_io_result(libssh2_channel_write_ex(channel_, 0, (char const*)data.data(), data.size()));
	}

	bool poll_read() override {
		return libssh2_poll_channel_read(channel_, 0) != 0;
	}

	bool eof() override {
		return libssh2_channel_eof(channel_) == 1;
	}

	engine_status send_eof() override {
		return to_status(libssh2_channel_send_eof(channel_));
	}

	engine_status wait_eof() override {
		return to_status(libssh2_channel_wait_eof(channel_));
	}

	engine_status close() override {
		return to_status(libssh2_channel_close(channel_));
	}

	engine_status wait_closed() override {
		return to_status(libssh2_channel_wait_closed(channel_));
	}

	int exit_status() override {
		return libssh2_channel_get_exit_status(channel_);
	}

private:
	LIBSSH2_CHANNEL* channel_;
};

class libssh2_sftp_handle : public sftp_handle_backend {
public:
	libssh2_sftp_handle(LIBSSH2_SFTP_HANDLE* h, socket_waiter wait)
	: handle_(h)
	, wait_(wait)
	{}

	~libssh2_sftp_handle() {
		if(handle_) {
			// libssh2 has no way to free a handle without closing it
			wait_.complete([&]{ return libssh2_sftp_close_handle(handle_); });
		}
	}

	io_result read(span buffer) override {
		return to_io_result(libssh2_sftp_read(handle_, (char*)buffer.data(), buffer.size()));
	}

	io_result write(const_span data) override {
		return to_io_result(libssh2_sftp_write(handle_, (char const*)data.data(), data.size()));
	}

	engine_status read_dir(std::optional<sftp::dir_entry>& entry) override {
		char name[1024];
		char longname[1024];
		LIBSSH2_SFTP_ATTRIBUTES attrs{};
		int rc = libssh2_sftp_readdir_ex(handle_, name, sizeof(name), longname, sizeof(longname), &attrs);
		if(rc > 0) {
			entry = sftp::dir_entry{std::string(name, std::size_t(rc)), longname, from_libssh2_attrs(attrs)};
		} else if(rc == 0) {
			entry.reset();
		}
		return to_status(rc);
	}

	engine_status fstat(sftp::file_attributes& out) override {
		LIBSSH2_SFTP_ATTRIBUTES attrs{};
		int rc = libssh2_sftp_fstat_ex(handle_, &attrs, 0);
		if(rc == 0) {
			out = from_libssh2_attrs(attrs);
		}
		return to_status(rc);
	}

	engine_status close() override {
		int rc = libssh2_sftp_close_handle(handle_);
		if(rc != LIBSSH2_ERROR_EAGAIN) {
			// the handle is released by libssh2 also when closing fails
			handle_ = nullptr;
		}
		return to_status(rc);
	}

private:
	LIBSSH2_SFTP_HANDLE* handle_;
	socket_waiter wait_;
};

class libssh2_sftp : public sftp_backend {
public:
	libssh2_sftp(LIBSSH2_SFTP* sftp, socket_waiter wait)
	: session_(wait.session)
	, sftp_(sftp)
	, wait_(wait)
	{}

	~libssh2_sftp() {
		if(sftp_) {
			wait_.complete([&]{ return libssh2_sftp_shutdown(sftp_); });
		}
	}

	engine_status open(std::string_view path, sftp::open_mode flags, std::uint32_t mode, sftp_open_type type, std::unique_ptr<sftp_handle_backend>& out) override {
		int open_type = type == sftp_open_type::directory ? LIBSSH2_SFTP_OPENDIR : LIBSSH2_SFTP_OPENFILE;
		LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, path.data(), unsigned(path.size()),
			type == sftp_open_type::directory ? 0 : to_libssh2_flags(flags), long(mode), open_type);
		if(!h) {
			return null_status(session_);
		}
		out = std::make_unique<libssh2_sftp_handle>(h, wait_);
		return engine_status::ok;
	}

	engine_status rename(std::string_view old_path, std::string_view new_path, sftp::rename_flags flags) override {
		return to_status(libssh2_sftp_rename_ex(sftp_, old_path.data(), unsigned(old_path.size()),
			new_path.data(), unsigned(new_path.size()), to_libssh2_rename_flags(flags)));
	}

	engine_status stat(std::string_view path, sftp::file_attributes& out) override {
		LIBSSH2_SFTP_ATTRIBUTES attrs{};
		int rc = libssh2_sftp_stat_ex(sftp_, path.data(), unsigned(path.size()), LIBSSH2_SFTP_STAT, &attrs);
		if(rc == 0) {
			out = from_libssh2_attrs(attrs);
		}
		return to_status(rc);
	}

	engine_status unlink(std::string_view path) override {
		return to_status(libssh2_sftp_unlink_ex(sftp_, path.data(), unsigned(path.size())));
	}

	engine_status mkdir(std::string_view path, std::uint32_t mode) override {
		return to_status(libssh2_sftp_mkdir_ex(sftp_, path.data(), unsigned(path.size()), long(mode)));
	}

	engine_status rmdir(std::string_view path) override {
		return to_status(libssh2_sftp_rmdir_ex(sftp_, path.data(), unsigned(path.size())));
	}

	engine_status shutdown() override {
		int rc = libssh2_sftp_shutdown(sftp_);
		if(rc != LIBSSH2_ERROR_EAGAIN) {
			sftp_ = nullptr;
		}
		return to_status(rc);
	}

	sftp::sftp_error last_error() const override {
		if(!sftp_ || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_SFTP_PROTOCOL) {
			return {};
		}
		auto code = std::uint32_t(libssh2_sftp_last_error(sftp_));
		return sftp::sftp_error(code, sftp::to_string(sftp::status_code(code)));
	}

private:
	LIBSSH2_SESSION* session_;
	LIBSSH2_SFTP* sftp_;
	socket_waiter wait_;
};

class libssh2_session : public session_backend {
public:
	libssh2_session(LIBSSH2_SESSION* s, logger& log)
	: session_(s)
	, log_(log)
	{}

	~libssh2_session() {
		libssh2_session_free(session_);
	}

	void set_blocking(bool b) override {
		libssh2_session_set_blocking(session_, b ? 1 : 0);
	}

	engine_status handshake(native_socket sock) override {
		socket_ = sock;
		auto res = to_status(libssh2_session_handshake(session_, libssh2_socket_t(sock)));
		if(res == engine_status::ok) {
			log_.log(logger::debug_trace, "libssh2 handshake done [kex={}, hostkey={}]",
				method(LIBSSH2_METHOD_KEX), method(LIBSSH2_METHOD_HOSTKEY));
		}
		return res;
	}

	std::optional<host_key> get_host_key() const override {
		std::size_t len = 0;
		int type = 0;
		char const* key = libssh2_session_hostkey(session_, &len, &type);
		if(!key || !len) {
			return std::nullopt;
		}
		auto p = (std::byte const*)key;
		return host_key{from_libssh2_key_type(type), byte_vector(p, p+len)};
	}

	engine_status auth_password(std::string_view username, std::string_view password) override {
		return to_status(libssh2_userauth_password_ex(session_, username.data(), unsigned(username.size()),
			password.data(), unsigned(password.size()), nullptr));
	}

	engine_status auth_public_key_file(std::string_view username, std::string const& public_key_path,
		std::string const& private_key_path, std::string_view passphrase) override
	{
		std::string pass(passphrase);
		return to_status(libssh2_userauth_publickey_fromfile_ex(session_, username.data(), unsigned(username.size()),
			public_key_path.empty() ? nullptr : public_key_path.c_str(), private_key_path.c_str(), pass.c_str()));
	}

	bool authenticated() const override {
		return libssh2_userauth_authenticated(session_) != 0;
	}

	engine_status open_session_channel(std::unique_ptr<channel_backend>& out) override {
		LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
		if(!ch) {
			return null_status(session_);
		}
		out = std::make_unique<libssh2_channel>(ch);
		return engine_status::ok;
	}

	engine_status scp_send(std::string_view path, std::uint32_t mode, std::uint64_t size, std::unique_ptr<channel_backend>& out) override {
		std::string p(path);
		LIBSSH2_CHANNEL* ch = libssh2_scp_send64(session_, p.c_str(), int(mode & 0777), libssh2_int64_t(size), 0, 0);
		if(!ch) {
			return null_status(session_);
		}
		out = std::make_unique<libssh2_channel>(ch);
		return engine_status::ok;
	}

	engine_status scp_receive(std::string_view path, std::unique_ptr<channel_backend>& out, scp_file_info& info) override {
		std::string p(path);
		libssh2_struct_stat st{};
		LIBSSH2_CHANNEL* ch = libssh2_scp_recv2(session_, p.c_str(), &st);
		if(!ch) {
			return null_status(session_);
		}
		info.size = std::uint64_t(st.st_size);
		info.mode = std::uint32_t(st.st_mode);
		out = std::make_unique<libssh2_channel>(ch);
		return engine_status::ok;
	}

	engine_status sftp_init(std::unique_ptr<sftp_backend>& out) override {
		LIBSSH2_SFTP* sftp = libssh2_sftp_init(session_);
		if(!sftp) {
			return null_status(session_);
		}
		out = std::make_unique<libssh2_sftp>(sftp, waiter());
		return engine_status::ok;
	}

	bool wait_socket(std::chrono::milliseconds timeout) override {
		return waiter()(timeout);
	}

	engine_status disconnect(std::string_view description) override {
		std::string d(description);
		return to_status(libssh2_session_disconnect_ex(session_, SSH_DISCONNECT_BY_APPLICATION, d.c_str(), ""));
	}

	engine_error last_error() const override {
		char* msg = nullptr;
		int len = 0;
		int code = libssh2_session_last_error(session_, &msg, &len, 0);
		return engine_error{code, msg ? std::string(msg, std::size_t(len)) : std::string()};
	}

private:
	socket_waiter waiter() const {
		return socket_waiter{session_, socket_, &log_};
	}

	std::string_view method(int type) const {
		char const* m = libssh2_session_methods(session_, type);
		return m ? m : "";
	}

private:
	LIBSSH2_SESSION* session_;
	logger& log_;
	native_socket socket_{-1};
};

}

libssh2_engine::libssh2_engine() {
	int rc = libssh2_init(0);
	if(rc != 0) {
		throw handshake_error("libssh2 initialisation failed", rc);
	}
}

libssh2_engine::~libssh2_engine() {
	libssh2_exit();
}

std::unique_ptr<session_backend> libssh2_engine::create_session(logger& log) {
	LIBSSH2_SESSION* s = libssh2_session_init();
	if(!s) {
		log.log(logger::error, "libssh2_session_init failed");
		return nullptr;
	}
	log.log(logger::debug_trace, "libssh2 session created [version={}]", libssh2_version(0));
	return std::make_unique<libssh2_session>(s, log);
}

}
