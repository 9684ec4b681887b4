#include "scp.hpp"
#include "channel.hpp"
#include "sshkit/common/errors.hpp"
#include "sshkit/common/local_file.hpp"
#include "sshkit/common/util.hpp"

#include <algorithm>

namespace sshkit {

std::uint64_t scp_send(session& s, std::uint32_t mode, std::string const& local_path, std::string_view remote_path) {
	auto& log = s.log();
	auto file = local_file::open_read(local_path);
	std::uint64_t const size = file.size();

	log.log(logger::info, "scp send {} -> {} [size={}, mode={}]", local_path, remote_path, size, mode);

	auto res = with_channel_by(
		[&]{ return channel::open_scp_send(s, remote_path, mode, size); },
		[](channel& c) -> channel& { return c; },
		[&](channel& ch) {
			byte_vector buf(std::max<std::size_t>(s.settings().write_chunk_size, 1));
			std::uint64_t sent = 0;
			while(sent < size) {
				auto n = file.read(safe_subspan(buf, 0, std::size_t(std::min<std::uint64_t>(buf.size(), size - sent))));
				if(n == 0) {
					log.log(logger::error, "Local file {} ended after {} of {} bytes", local_path, sent, size);
					throw transfer_error("short read from '" + local_path + "': got " + std::to_string(sent) + " of " + std::to_string(size) + " bytes");
				}
				ch.write_all(safe_subspan(buf, 0, n));
				sent += n;
			}
			ch.send_eof();
			ch.wait_eof();
			return sent;
		});

	log.log(logger::debug, "scp send finished [bytes={}, exit status={}]", res.value, res.exit_status);
	return res.value;
}

std::uint64_t scp_receive(session& s, std::string_view remote_path, std::string const& local_path) {
	auto& log = s.log();
	auto file = local_file::open_write(local_path);

	auto res = with_channel_by(
		[&]{ return channel::open_scp_receive(s, remote_path); },
		[](scp_receive_channel& r) -> channel& { return r.chan; },
		[&](scp_receive_channel& r) {
			log.log(logger::info, "scp receive {} -> {} [size={}, mode={}]", remote_path, local_path, r.size, r.mode);

			std::size_t const chunk_size = std::max<std::size_t>(s.settings().read_chunk_size, 1);
			std::uint64_t received = 0;
			while(received < r.size) {
				auto want = std::size_t(std::min<std::uint64_t>(chunk_size, r.size - received));
				auto chunk = r.chan.read(want);
				if(!chunk) {
					s.wait_socket();
					continue;
				}
				if(chunk->empty()) {
					log.log(logger::error, "Remote file {} ended after {} of {} bytes", remote_path, received, r.size);
					throw transfer_error("premature end of data for '" + std::string(remote_path) + "': got "
						+ std::to_string(received) + " of " + std::to_string(r.size) + " bytes");
				}
				file.write(*chunk);
				received += chunk->size();
			}
			return received;
		});

	file.close();
	log.log(logger::debug, "scp receive finished [bytes={}, exit status={}]", res.value, res.exit_status);
	return res.value;
}

}
