// This file was developed by Thomas Müller <contact@tom94.net>.
// It is published under the GPLv3 License; see the LICENSE file.

#include "common.h"

#include <unilib/unicode.h>
#include <unilib/uninorms.h>
#include <unilib/utf.h>

#include <wcwidth/wcwidth.h>

using namespace std;

namespace teaty {

int utf8_char_length(unsigned char first_byte) {
	if ((first_byte & 0x80) == 0) {
		return 1;
	}

	if ((first_byte & 0xE0) == 0xC0) {
		return 2;
	}

	if ((first_byte & 0xF0) == 0xE0) {
		return 3;
	}

	if ((first_byte & 0xF8) == 0xF0) {
		return 4;
	}

	return 1; // Invalid UTF-8 byte, treat as single byte
}

bool is_utf8_continuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

u32string decode_utf8(const string& str) {
	u32string decoded;
	unilib::utf::decode(str.c_str(), decoded);
	return decoded;
}

string encode_utf8(const u32string& str) {
	string result;
	unilib::utf::encode(str, result);
	return result;
}

string encode_utf8(char32_t c) { return encode_utf8(u32string(1, c)); }

u32string nfc(const string& str) {
	u32string decoded = decode_utf8(str);
	unilib::uninorms::nfc(decoded);
	return decoded;
}

bool is_uppercase(char32_t c) { return (unilib::unicode::category(c) & unilib::unicode::Lu) != 0; }

int char_width(char32_t c) {
	if (c >= 0x1F300) {
		// Unicode range for emojis and other symbols
		return 2;
	}

	int width = mk_wcwidth(static_cast<wchar_t>(c));
	return width >= 0 ? width : 1;
}

size_t display_width(const u32string& str) {
	size_t width = 0;
	for (char32_t c : str) {
		width += char_width(c);
	}

	return width;
}

} // namespace teaty
