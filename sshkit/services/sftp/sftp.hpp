#ifndef SSHKIT_SFTP_HEADER
#define SSHKIT_SFTP_HEADER

#include "sshkit/common/types.hpp"

#include <optional>

namespace sshkit::sftp {

// flags and status codes as in draft-ietf-secsh-filexfer-02, mapped to the engine by the backend
enum open_mode : std::uint32_t {
	fxf_read   = 0x00000001,
	fxf_write  = 0x00000002,
	fxf_append = 0x00000004,
	fxf_creat  = 0x00000008,
	fxf_trunc  = 0x00000010,
	// with fxf_creat, fail if the file exists
	fxf_excl   = 0x00000020
};

inline open_mode operator|(open_mode l, open_mode r) {
	return open_mode(std::uint32_t(l) | std::uint32_t(r));
}

enum status_code : std::uint32_t {
	fx_ok                = 0,
	fx_eof               = 1,
	fx_no_such_file      = 2,
	fx_permission_denied = 3,
	fx_failure           = 4,
	fx_bad_message       = 5,
	fx_no_connection     = 6,
	fx_connection_lost   = 7,
	fx_op_unsupported    = 8,
	// later protocol versions
	fx_file_already_exists = 11
};
std::string_view to_string(status_code);

// only meaningful for servers talking protocol version 5 or later
enum rename_flags : std::uint32_t {
	rename_overwrite = 0x00000001,
	rename_atomic    = 0x00000002,
	rename_native    = 0x00000004
};

class sftp_error {
public:
	sftp_error() = default;
	sftp_error(std::uint32_t code, std::string_view msg)
	: code_((status_code)code)
	, message_(msg)
	{}

	status_code code() const { return code_; }
	std::string_view message() const { return message_; }

	/// this is an error if error code is not zero
	explicit operator bool() const {
		return code_ != 0;
	}

private:
	status_code code_{};
	std::string message_;
};

/// attributes the server reported, unset if the server did not send them
struct file_attributes {
	std::optional<std::uint64_t> size;
	std::optional<std::uint32_t> uid;
	std::optional<std::uint32_t> gid;
	/// posix mode including the file type bits
	std::optional<std::uint32_t> permissions;
	/// seconds since the epoch
	std::optional<std::uint32_t> atime;
	std::optional<std::uint32_t> mtime;

	bool is_directory() const;
};

struct dir_entry {
	std::string name;
	std::string longname;
	file_attributes attrs;

	std::uint64_t size() const { return attrs.size.value_or(0); }
};

}

#endif
