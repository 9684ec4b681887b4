#ifndef SSHKIT_LOCAL_FILE_HEADER
#define SSHKIT_LOCAL_FILE_HEADER

#include "types.hpp"

#include <fstream>

namespace sshkit {

/// Local file opened for either reading or writing, closed when destroyed
class local_file {
public:
	/// throws io_error if the file cannot be opened
	static local_file open_read(std::string const& path);
	static local_file open_write(std::string const& path);

	local_file(local_file&&) = default;
	local_file& operator=(local_file&&) = default;
	~local_file();

	std::string const& path() const { return path_; }
	bool is_open() const { return file_.is_open(); }

	/// size of the file when opened for reading
	std::uint64_t size() const { return size_; }

	/// read up to buffer size bytes, returns 0 at end of file
	std::size_t read(span buffer);

	/// write all of data
	void write(const_span data);

	/// flush and close, throws io_error if flushing fails
	void close();

private:
	local_file(std::string path, std::ios_base::openmode mode);

private:
	std::string path_;
	std::fstream file_;
	std::uint64_t size_{};
};

/// convenience for tools and tests
byte_vector read_file(std::string const& path);
void write_file(std::string const& path, const_span data);

}

#endif
