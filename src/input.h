// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include <string>
#include <variant>

namespace teaty {

struct CharacterTyped {
	char32_t character;
};

struct Quit {};
struct Reset {};
struct Ignored {};

using InputAction = std::variant<CharacterTyped, Quit, Reset, Ignored>;

// Maps the raw bytes of a single terminal event to the action it triggers.
//   ESC, Ctrl-C          -> Quit
//   Ctrl-R               -> Reset
//   printable character without modifiers -> CharacterTyped
//   anything else (escape sequences, shifted letters, Enter, Tab, Backspace, other control keys, malformed
//   UTF-8) -> Ignored
InputAction decode_input(const std::string& sequence);

// Reads raw-mode keystrokes from a terminal file descriptor, one event at a time.
class TerminalInput {
public:
	explicit TerminalInput(int fd) : mFd{fd} {}

	// Blocks until the next event arrives. A read interrupted by a signal (e.g. SIGWINCH on resize) yields
	// Ignored so that the caller redraws. Throws std::runtime_error if the terminal can no longer be read.
	InputAction next_action();

private:
	char read_byte();
	bool has_pending_input(int timeout_ms) const;

	int mFd;
};

} // namespace teaty
