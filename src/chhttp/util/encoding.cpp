#include "chhttp/util/encoding.hpp"

namespace chhttp {

static const char BASE64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static char GetBase64Char(unsigned char sixBits) {
	return BASE64_ALPHABET[sixBits];
}

std::string Base64Encode(const unsigned char *data, size_t len) {
	std::string result;
	result.reserve(((len + 2) / 3) * 4);
	size_t i = 0;

	while (i < len) {
		unsigned char b0 = data[i];
		unsigned char b1 = (i + 1 < len) ? data[i + 1] : 0;
		unsigned char b2 = (i + 2 < len) ? data[i + 2] : 0;

		result += GetBase64Char((b0 & MASK_TOP6) >> 2);

		result += GetBase64Char(((b0 & MASK_BOT2) << 4) | ((b1 & MASK_TOP4) >> 4));

		if (i + 1 < len) {
			result += GetBase64Char(((b1 & MASK_BOT4) << 2) | ((b2 & MASK_TOP2) >> 6));
		} else {
			result += '=';
		}

		if (i + 2 < len) {
			result += GetBase64Char(b2 & MASK_BOT6);
		} else {
			result += '=';
		}

		i += 3;
	}

	return result;
}

std::string Base64Encode(const std::string &input) {
	return Base64Encode(reinterpret_cast<const unsigned char *>(input.c_str()), input.length());
}

} // namespace chhttp
