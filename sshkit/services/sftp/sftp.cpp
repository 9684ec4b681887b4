#include "sftp.hpp"

namespace sshkit::sftp {

std::string_view to_string(status_code c) {
	switch(c) {
		case fx_ok:                  return "ok";
		case fx_eof:                 return "end of file";
		case fx_no_such_file:        return "no such file";
		case fx_permission_denied:   return "permission denied";
		case fx_failure:             return "failure";
		case fx_bad_message:         return "bad message";
		case fx_no_connection:       return "no connection";
		case fx_connection_lost:     return "connection lost";
		case fx_op_unsupported:      return "operation unsupported";
		case fx_file_already_exists: return "file already exists";
	}
	return "unknown status";
}

bool file_attributes::is_directory() const {
	// S_IFMT / S_IFDIR
	return permissions && (*permissions & 0170000) == 0040000;
}

}
