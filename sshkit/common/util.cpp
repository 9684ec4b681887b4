#include "util.hpp"

#include <nettle/base64.h>

namespace sshkit {

byte_vector decode_base64(std::string_view s) {
	if(s.size() % 4 == 1) {
		return {};
	}

	// nettle requires the padding
	std::string in(s);
	in.append((4 - in.size() % 4) % 4, '=');

	byte_vector res(BASE64_DECODE_LENGTH(in.size()));
	std::size_t len = res.size();

	base64_decode_ctx ctx;
	base64_decode_init(&ctx);
	if(!base64_decode_update(&ctx, &len, to_uint8_ptr(res), in.size(), in.data()) || !base64_decode_final(&ctx)) {
		return {};
	}
	res.resize(len);
	return res;
}

std::string encode_base64(const_span s, bool pad) {
	std::string res(BASE64_ENCODE_RAW_LENGTH(s.size()), '\0');
	base64_encode_raw(res.data(), s.size(), to_uint8_ptr(s));
	if(!pad) {
		auto e = res.find_last_not_of('=');
		res.resize(e == std::string::npos ? 0 : e + 1);
	}
	return res;
}

std::vector<std::string_view> split(std::string_view s, char separator) {
	std::vector<std::string_view> res;
	std::string_view::size_type pos = 0;
	for(auto f = s.find(separator); f != std::string_view::npos; f = s.find(separator, pos)) {
		res.push_back(s.substr(pos, f-pos));
		pos = f+1;
	}
	res.push_back(s.substr(pos));
	return res;
}

std::string_view trim(std::string_view s) {
	auto const ws = " \t\r\n";
	auto b = s.find_first_not_of(ws);
	if(b == std::string_view::npos) {
		return {};
	}
	auto e = s.find_last_not_of(ws);
	return s.substr(b, e-b+1);
}

}
