#include "sftp_session.hpp"
#include "sshkit/client/session.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/local_file.hpp"
#include "sshkit/common/util.hpp"

#include <exception>

namespace sshkit::sftp {

sftp_handle::sftp_handle(sftp_session& s, std::unique_ptr<sftp_handle_backend> b, std::string path)
: sftp_(s)
, backend_(std::move(b))
, path_(std::move(path))
{
}

sftp_handle::~sftp_handle() {
	if(is_open()) {
		try {
			close();
		} catch(std::exception const& e) {
			sftp_.owner().log().log(logger::error, "Failed to close sftp handle for {}: {}", path_, e.what());
		}
	}
}

void sftp_handle::require_open(std::string_view op) const {
	if(!is_open()) {
		throw transfer_error("cannot " + std::string(op) + ", sftp handle for '" + path_ + "' is closed");
	}
}

byte_vector sftp_handle::read(std::size_t max) {
	require_open("read");
	byte_vector buf(max);
	auto res = sftp_.owner().retry([&]{ return backend_->read(buf); });
	if(res.status != engine_status::ok) {
		sftp_.fail("read failed", path_);
	}
	buf.resize(res.bytes);
	return buf;
}

void sftp_handle::write(const_span data) {
	require_open("write");
	auto& s = sftp_.owner();
	std::size_t const chunk_size = std::max<std::size_t>(s.settings().write_chunk_size, 1);
	std::size_t written = 0;
	while(written < data.size()) {
		auto chunk = safe_subspan(data, written, chunk_size);
		auto res = s.retry([&]{ return backend_->write(chunk); });
		if(res.status != engine_status::ok || res.bytes == 0) {
			sftp_.fail("write failed", path_);
		}
		written += res.bytes;
	}
}

std::optional<dir_entry> sftp_handle::read_dir() {
	require_open("read directory");
	std::optional<dir_entry> entry;
	auto res = sftp_.owner().retry([&]{ return backend_->read_dir(entry); });
	if(res != engine_status::ok) {
		sftp_.fail("read directory failed", path_);
	}
	return entry;
}

file_attributes sftp_handle::fstat() {
	require_open("fstat");
	file_attributes attrs;
	auto res = sftp_.owner().retry([&]{ return backend_->fstat(attrs); });
	if(res != engine_status::ok) {
		sftp_.fail("fstat failed", path_);
	}
	return attrs;
}

void sftp_handle::close() {
	if(!is_open()) {
		return;
	}
	closed_ = true;
	auto res = sftp_.owner().retry([&]{ return backend_->close(); });
	backend_.reset();
	if(res != engine_status::ok) {
		sftp_.fail("close failed", path_);
	}
	sftp_.owner().log().log(logger::debug_trace, "sftp handle closed [path={}]", path_);
}

sftp_session::sftp_session(session& s)
: session_(s)
, log_(s.log())
{
	auto res = s.retry([&]{ return s.backend().sftp_init(backend_); });
	if(res != engine_status::ok || !backend_) {
		backend_.reset();
		auto msg = s.error_message("failed to start sftp subsystem");
		log_.log(logger::error, "{}", msg);
		throw channel_error(msg, s.last_error().code);
	}
	log_.log(logger::info, "SFTP session started");
}

sftp_session::~sftp_session() {
	try {
		shutdown();
	} catch(std::exception const& e) {
		log_.log(logger::error, "Failed to shut down sftp session: {}", e.what());
	}
}

void sftp_session::shutdown() {
	if(!backend_) {
		return;
	}
	auto res = session_.retry([&]{ return backend_->shutdown(); });
	backend_.reset();
	if(res != engine_status::ok) {
		auto msg = session_.error_message("sftp shutdown failed");
		log_.log(logger::error, "{}", msg);
		throw channel_error(msg, session_.last_error().code);
	}
	log_.log(logger::info, "SFTP session shut down");
}

sftp_backend& sftp_session::backend() {
	if(!backend_) {
		throw channel_error("sftp session is shut down");
	}
	return *backend_;
}

void sftp_session::fail(std::string_view what, std::string_view path) {
	std::string msg = std::string(what) + " for '" + std::string(path) + "'";
	int code = 0;
	auto err = backend_ ? backend_->last_error() : sftp_error{};
	if(err) {
		code = int(err.code());
		msg += ": " + std::string(to_string(err.code()));
		if(!err.message().empty()) {
			msg += " (" + std::string(err.message()) + ")";
		}
	} else {
		auto e = session_.last_error();
		code = e.code;
		if(!e.message.empty()) {
			msg += ": " + e.message;
		}
	}
	log_.log(logger::error, "sftp: {} [code={}]", msg, code);
	throw transfer_error(msg, code);
}

sftp_handle sftp_session::open_file(std::string_view path, open_mode flags, std::uint32_t mode) {
	std::unique_ptr<sftp_handle_backend> h;
	auto res = session_.retry([&]{ return backend().open(path, flags, mode, sftp_open_type::file, h); });
	if(res != engine_status::ok || !h) {
		fail("open file failed", path);
	}
	log_.log(logger::debug_trace, "sftp file opened [path={}, flags={}, mode={}]", path, std::uint32_t(flags), mode);
	return sftp_handle(*this, std::move(h), std::string(path));
}

sftp_handle sftp_session::open_dir(std::string_view path) {
	std::unique_ptr<sftp_handle_backend> h;
	auto res = session_.retry([&]{ return backend().open(path, fxf_read, 0, sftp_open_type::directory, h); });
	if(res != engine_status::ok || !h) {
		fail("open directory failed", path);
	}
	log_.log(logger::debug_trace, "sftp directory opened [path={}]", path);
	return sftp_handle(*this, std::move(h), std::string(path));
}

std::vector<dir_entry> sftp_session::list_dir(std::string_view path) {
	auto dir = open_dir(path);
	std::vector<dir_entry> res;
	while(auto e = dir.read_dir()) {
		res.push_back(std::move(*e));
	}
	dir.close();
	log_.log(logger::debug, "listed {} entries in {}", res.size(), path);
	return res;
}

std::uint64_t sftp_session::send_file(std::uint32_t mode, std::string const& local_path, std::string_view remote_path) {
	auto file = local_file::open_read(local_path);
	std::uint64_t const size = file.size();

	log_.log(logger::info, "sftp send {} -> {} [size={}, mode={}]", local_path, remote_path, size, mode);

	auto remote = open_file(remote_path, fxf_write | fxf_creat | fxf_trunc | fxf_excl, mode);

	byte_vector buf(std::max<std::size_t>(session_.settings().write_chunk_size, 1));
	std::uint64_t sent = 0;
	while(true) {
		auto n = file.read(buf);
		if(n == 0) {
			break;
		}
		remote.write(safe_subspan(buf, 0, n));
		sent += n;
	}
	remote.close();

	if(sent != size) {
		log_.log(logger::error, "Local file {} changed size during transfer [expected={}, sent={}]", local_path, size, sent);
		throw transfer_error("local file '" + local_path + "' changed size during transfer");
	}
	return sent;
}

std::uint64_t sftp_session::receive_file(std::string const& local_path, std::string_view remote_path) {
	auto remote = open_file(remote_path, fxf_read, 0);
	auto attrs = remote.fstat();
	if(!attrs.size) {
		log_.log(logger::error, "Server did not report size of {}", remote_path);
		throw transfer_error("size of remote file '" + std::string(remote_path) + "' is not available");
	}
	std::uint64_t const size = *attrs.size;

	log_.log(logger::info, "sftp receive {} -> {} [size={}]", remote_path, local_path, size);

	auto file = local_file::open_write(local_path);
	std::size_t const chunk_size = std::max<std::size_t>(session_.settings().read_chunk_size, 1);
	std::uint64_t received = 0;
	while(received < size) {
		auto chunk = remote.read(std::size_t(std::min<std::uint64_t>(chunk_size, size - received)));
		if(chunk.empty()) {
			log_.log(logger::error, "Remote file {} ended after {} of {} bytes", remote_path, received, size);
			throw transfer_error("premature end of file '" + std::string(remote_path) + "': got "
				+ std::to_string(received) + " of " + std::to_string(size) + " bytes");
		}
		file.write(chunk);
		received += chunk.size();
	}
	remote.close();
	file.close();
	return received;
}

void sftp_session::rename(std::string_view old_path, std::string_view new_path) {
	auto res = session_.retry([&]{ return backend().rename(old_path, new_path, rename_flags(rename_atomic | rename_native)); });
	if(res != engine_status::ok) {
		fail("rename to '" + std::string(new_path) + "' failed", old_path);
	}
	log_.log(logger::debug, "renamed {} -> {}", old_path, new_path);
}

file_attributes sftp_session::stat(std::string_view path) {
	file_attributes attrs;
	auto res = session_.retry([&]{ return backend().stat(path, attrs); });
	if(res != engine_status::ok) {
		fail("stat failed", path);
	}
	return attrs;
}

void sftp_session::remove_file(std::string_view path) {
	auto res = session_.retry([&]{ return backend().unlink(path); });
	if(res != engine_status::ok) {
		fail("remove file failed", path);
	}
	log_.log(logger::debug, "removed file {}", path);
}

void sftp_session::make_dir(std::string_view path, std::uint32_t mode) {
	auto res = session_.retry([&]{ return backend().mkdir(path, mode); });
	if(res != engine_status::ok) {
		fail("make directory failed", path);
	}
	log_.log(logger::debug, "created directory {}", path);
}

void sftp_session::remove_dir(std::string_view path) {
	auto res = session_.retry([&]{ return backend().rmdir(path); });
	if(res != engine_status::ok) {
		fail("remove directory failed", path);
	}
	log_.log(logger::debug, "removed directory {}", path);
}

}
