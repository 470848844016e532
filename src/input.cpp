// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "input.h"
#include "common.h"

#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>

using namespace std;

namespace teaty {

const char KEY_ESC = 27;
const char KEY_CTRL_C = 3;
const char KEY_CTRL_R = 18;
const char KEY_DELETE = 127;

// Bytes of an escape sequence (arrow keys, mouse reports, Alt+key) arrive together; a lone ESC does not.
const int ESCAPE_SEQUENCE_TIMEOUT_MS = 25;

// Rejects invalid lead bytes, overlong forms, surrogates and code points beyond U+10FFFF.
bool is_well_formed_utf8(const string& sequence) {
	unsigned char first = sequence[0];
	if (first >= 0xF5 || first == 0xC0 || first == 0xC1 || is_utf8_continuation(first)) {
		return false;
	}

	if (sequence.size() != (size_t)utf8_char_length(first)) {
		return false;
	}

	for (size_t i = 1; i < sequence.size(); i++) {
		if (!is_utf8_continuation(sequence[i])) {
			return false;
		}
	}

	if (sequence.size() < 2) {
		return true;
	}

	unsigned char second = sequence[1];
	switch (first) {
		case 0xE0: return second >= 0xA0;
		case 0xED: return second < 0xA0;
		case 0xF0: return second >= 0x90;
		case 0xF4: return second < 0x90;
		default: return true;
	}
}

InputAction decode_input(const string& sequence) {
	if (sequence.empty()) {
		return Ignored{};
	}

	unsigned char first = sequence[0];
	if (sequence.size() == 1) {
		switch (first) {
			case KEY_ESC:
			case KEY_CTRL_C: return Quit{};
			case KEY_CTRL_R: return Reset{};
			default: break;
		}

		if (first < 0x20 || first == KEY_DELETE) {
			return Ignored{};
		}
	}

	if (first == KEY_ESC) {
		return Ignored{};
	}

	// Exactly one well-formed UTF-8 character
	if (!is_well_formed_utf8(sequence)) {
		return Ignored{};
	}

	u32string decoded = decode_utf8(sequence);
	if (decoded.size() != 1) {
		return Ignored{};
	}

	char32_t c = decoded[0];
	if (c < 0x20 || (c >= 0x7F && c < 0xA0) || (c >= 0xD800 && c <= 0xDFFF) || c > 0x10FFFF) {
		return Ignored{};
	}

	// Shifted keys count as a modifier combination
	if (is_uppercase(c)) {
		return Ignored{};
	}

	return CharacterTyped{c};
}

InputAction TerminalInput::next_action() {
	char c;
	ssize_t n = read(mFd, &c, 1);
	if (n < 0) {
		if (errno == EINTR) {
			return Ignored{};
		}

		throw runtime_error{format("Failed to read from terminal: {}", strerror(errno))};
	} else if (n == 0) {
		throw runtime_error{"Terminal input closed"};
	}

	string sequence{c};
	if (c == KEY_ESC) {
		while (has_pending_input(ESCAPE_SEQUENCE_TIMEOUT_MS)) {
			sequence.push_back(read_byte());
		}
	} else {
		int len = utf8_char_length(c);
		for (int i = 1; i < len; i++) {
			sequence.push_back(read_byte());
		}
	}

	return decode_input(sequence);
}

char TerminalInput::read_byte() {
	char c;
	while (true) {
		ssize_t n = read(mFd, &c, 1);
		if (n == 1) {
			return c;
		} else if (n == 0) {
			throw runtime_error{"Terminal input closed"};
		} else if (errno != EINTR) {
			throw runtime_error{format("Failed to read from terminal: {}", strerror(errno))};
		}
	}
}

bool TerminalInput::has_pending_input(int timeout_ms) const {
	struct pollfd pfd = {mFd, POLLIN, 0};
	int result = poll(&pfd, 1, timeout_ms);
	if (result < 0) {
		if (errno == EINTR) {
			return false;
		}

		throw runtime_error{format("Failed to poll terminal: {}", strerror(errno))};
	}

	return result > 0 && (pfd.revents & POLLIN);
}

} // namespace teaty
