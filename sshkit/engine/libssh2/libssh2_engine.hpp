#ifndef SSHKIT_LIBSSH2_ENGINE_HEADER
#define SSHKIT_LIBSSH2_ENGINE_HEADER

#include "sshkit/engine/engine.hpp"

namespace sshkit {

/** \brief Engine implemented with libssh2
 *
 *  Initialises libssh2 on construction and cleans it up on destruction, only one instance should exist at a time.
 */
class libssh2_engine : public engine {
public:
	libssh2_engine();
	~libssh2_engine();

	libssh2_engine(libssh2_engine const&) = delete;
	libssh2_engine& operator=(libssh2_engine const&) = delete;

	std::unique_ptr<session_backend> create_session(logger&) override;
};

}

#endif
