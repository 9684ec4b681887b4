#ifndef SSHKIT_CLIENT_SCP_HEADER
#define SSHKIT_CLIENT_SCP_HEADER

#include "sshkit/common/types.hpp"

namespace sshkit {

class session;

/// upload local file to remote_path with the given permission bits, returns number of bytes sent
std::uint64_t scp_send(session&, std::uint32_t mode, std::string const& local_path, std::string_view remote_path);

/// download remote_path to local file, returns number of bytes received (the size declared by the remote side)
std::uint64_t scp_receive(session&, std::string_view remote_path, std::string const& local_path);

}

#endif
