#ifndef SSHKIT_SFTP_SESSION_HEADER
#define SSHKIT_SFTP_SESSION_HEADER

#include "sftp.hpp"
#include "sshkit/engine/engine.hpp"

#include <vector>

namespace sshkit {
class session;
}

namespace sshkit::sftp {

class sftp_session;

/** \brief Open remote file or directory
 *
 *  Closed by close() or the destructor, must not outlive the sftp_session it was opened from.
 */
class sftp_handle {
public:
	sftp_handle(sftp_handle&&) = default;
	~sftp_handle();

	std::string const& path() const { return path_; }
	bool is_open() const { return backend_ && !closed_; }

	/// read up to max bytes, returns empty vector at end of file
	byte_vector read(std::size_t max);

	/// write all of data at current position
	void write(const_span data);

	/// next directory entry, nullopt when there are no more entries
	std::optional<dir_entry> read_dir();

	file_attributes fstat();

	/// does nothing if already closed
	void close();

private:
	friend class sftp_session;
	sftp_handle(sftp_session&, std::unique_ptr<sftp_handle_backend>, std::string path);

	void require_open(std::string_view op) const;

private:
	sftp_session& sftp_;
	std::unique_ptr<sftp_handle_backend> backend_;
	std::string path_;
	bool closed_{};
};

/** \brief SFTP subsystem running on a channel of the session
 *
 *  Remote failures are reported as transfer_error with the sftp status code.
 */
class sftp_session {
public:
	/// start the sftp subsystem, throws channel_error on failure
	explicit sftp_session(session&);
	~sftp_session();

	sftp_session(sftp_session const&) = delete;
	sftp_session& operator=(sftp_session const&) = delete;

	session& owner() { return session_; }

	/// does nothing if already shut down
	void shutdown();
	bool is_open() const { return backend_ != nullptr; }

	/// all entries of directory in the order the server returns them
	std::vector<dir_entry> list_dir(std::string_view path);

	/// upload local file, fails without writing anything if the remote file exists. Returns number of bytes sent
	std::uint64_t send_file(std::uint32_t mode, std::string const& local_path, std::string_view remote_path);

	/// download remote file, reads exactly the size reported by fstat. Returns number of bytes received
	std::uint64_t receive_file(std::string const& local_path, std::string_view remote_path);

	/// fails if new_path exists
	void rename(std::string_view old_path, std::string_view new_path);

	sftp_handle open_file(std::string_view path, open_mode flags, std::uint32_t mode = 0644);
	sftp_handle open_dir(std::string_view path);

	file_attributes stat(std::string_view path);
	void remove_file(std::string_view path);
	void make_dir(std::string_view path, std::uint32_t mode = 0755);
	void remove_dir(std::string_view path);

	/// throws transfer_error describing the last failed request
	[[noreturn]] void fail(std::string_view what, std::string_view path);

	sftp_backend& backend();

private:
	session& session_;
	logger& log_;
	std::unique_ptr<sftp_backend> backend_;
};

}

#endif
