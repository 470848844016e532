// This file was developed by Thomas Müller <contact@tom94.net>.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace teaty {

template <typename T> class ScopeGuard {
public:
	ScopeGuard(const T& callback) : mCallback{callback} {}
	ScopeGuard(T&& callback) : mCallback{std::move(callback)} {}
	ScopeGuard(const ScopeGuard<T>& other) = delete;
	ScopeGuard& operator=(const ScopeGuard<T>& other) = delete;
	~ScopeGuard() { mCallback(); }

private:
	T mCallback;
};

template <typename T> std::string join(const T& components, const std::string& delim) {
	std::ostringstream s;
	for (const auto& component : components) {
		if (&components[0] != &component) {
			s << delim;
		}
		s << component;
	}

	return s.str();
}

// Returns the number of bytes in a UTF-8 character based on its first byte
int utf8_char_length(unsigned char first_byte);

// Check if this byte is a continuation byte in UTF-8
bool is_utf8_continuation(unsigned char byte);

std::u32string decode_utf8(const std::string& str);
std::string encode_utf8(const std::u32string& str);
std::string encode_utf8(char32_t c);

// Decodes and composes to NFC, so that text from different sources compares per code point.
std::u32string nfc(const std::string& str);

// Uppercase letters (general category Lu); terminals only send them with Shift held
bool is_uppercase(char32_t c);

// Get the display width of a single code point in terminal columns
int char_width(char32_t c);

size_t display_width(const std::u32string& str);

} // namespace teaty
