#ifndef SSHKIT_UTIL_HEADER
#define SSHKIT_UTIL_HEADER

#include "types.hpp"

#include <algorithm>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sshkit {

/// accepts input with or without padding, returns empty vector for invalid input
byte_vector decode_base64(std::string_view);
std::string encode_base64(const_span, bool pad = false);

template<class T> concept Byte = std::is_same_v<std::remove_cv_t<T>, std::byte>;

/// std::span doesn't clamp the count to the size-offset which is what we want
template<Byte T>
inline std::span<T> safe_subspan(std::span<T> s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	if(offset >= s.size()) {
		return {};
	}
	if(count != std::dynamic_extent) {
		count = std::min(count, s.size()-offset);
	}
	return s.subspan(offset, count);
}

inline span safe_subspan(byte_vector& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(span(s), offset, count);
}

inline const_span safe_subspan(byte_vector const& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(const_span(s), offset, count);
}

/// append s to the end of v
inline void append(byte_vector& v, const_span s) {
	v.insert(v.end(), s.begin(), s.end());
}

/// split string by separator, empty parts are kept
std::vector<std::string_view> split(std::string_view s, char separator);

/// remove leading and trailing white space
std::string_view trim(std::string_view s);

}

#endif
