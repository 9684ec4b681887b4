#include "local_file.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

namespace sshkit {

local_file::local_file(std::string path, std::ios_base::openmode mode)
: path_(std::move(path))
{
	file_.open(path_, mode | std::ios_base::binary);
	if(!file_.is_open()) {
		int err = errno;
		throw io_error("failed to open local file '" + path_ + "': " + std::strerror(err), err);
	}
}

local_file local_file::open_read(std::string const& path) {
	local_file f(path, std::ios_base::in);
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if(ec) {
		throw io_error("failed to get size of local file '" + path + "': " + ec.message(), ec.value());
	}
	f.size_ = size;
	return f;
}

local_file local_file::open_write(std::string const& path) {
	return local_file(path, std::ios_base::out | std::ios_base::trunc);
}

local_file::~local_file() {
	if(file_.is_open()) {
		file_.close();
	}
}

std::size_t local_file::read(span buffer) {
	if(!file_.is_open()) {
		throw io_error("local file '" + path_ + "' is not open");
	}
	file_.read((char*)buffer.data(), std::streamsize(buffer.size()));
	if(file_.bad()) {
		throw io_error("failed to read local file '" + path_ + "'");
	}
	return std::size_t(file_.gcount());
}

void local_file::write(const_span data) {
	if(!file_.is_open()) {
		throw io_error("local file '" + path_ + "' is not open");
	}
	file_.write((char const*)data.data(), std::streamsize(data.size()));
	if(!file_) {
		throw io_error("failed to write local file '" + path_ + "'");
	}
}

void local_file::close() {
	if(file_.is_open()) {
		file_.flush();
		bool ok = bool(file_);
		file_.close();
		if(!ok) {
			throw io_error("failed to flush local file '" + path_ + "'");
		}
	}
}

byte_vector read_file(std::string const& path) {
	auto f = local_file::open_read(path);
	byte_vector b(f.size());
	std::size_t pos = 0;
	while(pos < b.size()) {
		auto n = f.read(span(b).subspan(pos));
		if(!n) {
			throw io_error("unexpected end of local file '" + path + "'");
		}
		pos += n;
	}
	return b;
}

void write_file(std::string const& path, const_span data) {
	auto f = local_file::open_write(path);
	f.write(data);
	f.close();
}

}
