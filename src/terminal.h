// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include "render.h"

#include <string>
#include <vector>

#include <termios.h>

namespace teaty {

extern const std::string ANSI_RESET;
extern const std::string ANSI_MATCHED;
extern const std::string ANSI_MISMATCHED;
extern const std::string ANSI_PENDING;
extern const std::string ANSI_TITLE;
extern const std::string ANSI_WPM;

const size_t DEFAULT_FRAME_WIDTH = 80;
const size_t MIN_FRAME_WIDTH = 32;

// Enables raw input mode on construction and restores the original settings on destruction. While active,
// the frame is drawn on the alternate screen.
class TerminalSettings {
public:
	explicit TerminalSettings(int fd);
	TerminalSettings(const TerminalSettings&) = delete;
	TerminalSettings& operator=(const TerminalSettings&) = delete;
	~TerminalSettings() { restore(); }

	void restore();

private:
	int mFd;
	struct termios mOrig;
	bool mRestored = false;
};

size_t console_width();

// Makes SIGWINCH interrupt blocking reads so that the loop redraws at the new size.
void install_resize_handler();

// Breaks tagged text into lines of at most `width` columns at separators. Words wider than a line are split.
std::vector<std::vector<TaggedChar>> wrap_text(const std::vector<TaggedChar>& text, size_t width);

// Complete frame as ANSI output, starting at the top-left corner of the screen.
std::string draw_frame(const DisplayModel& model, size_t width);

} // namespace teaty
