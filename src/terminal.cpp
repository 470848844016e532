// This file was developed by Thomas Müller <contact@tom94.net>.
// It is published under the GPLv3 License; see the LICENSE file.

#include "terminal.h"
#include "common.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <iostream>
#include <stdexcept>

#include <csignal>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace std;

namespace teaty {

const string ANSI_RESET = "\033[0m";
const string ANSI_MATCHED = "\033[32m";
const string ANSI_MISMATCHED = "\033[31m";
const string ANSI_PENDING = "\033[92m";
const string ANSI_TITLE = "\033[1;34m";
const string ANSI_WPM = "\033[1;33m";

const string ANSI_CURSOR_HOME = "\033[H";
const string ANSI_CLEAR_TO_END_OF_LINE = "\033[K";
const string ANSI_CLEAR_TO_END_OF_SCREEN = "\033[J";
const string ANSI_ENTER_ALTERNATE_SCREEN = "\033[?1049h\033[?25l";
const string ANSI_LEAVE_ALTERNATE_SCREEN = "\033[?25h\033[?1049l";

const string WORDS_BOX_TITLE = "Words to Type";
const string WPM_BOX_TITLE = "Speed (WPM)";

TerminalSettings::TerminalSettings(int fd) : mFd{fd} {
	if (tcgetattr(mFd, &mOrig) != 0) {
		throw runtime_error{format("Cannot read terminal settings: {}", strerror(errno))};
	}

	// Enable raw input mode. Ctrl-C, Ctrl-R and friends must reach us as bytes rather than signals.
	struct termios raw = mOrig;
	raw.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
	raw.c_iflag &= ~(IXON | ICRNL);
	if (tcsetattr(mFd, TCSAFLUSH, &raw) != 0) {
		throw runtime_error{format("Cannot enable raw input mode: {}", strerror(errno))};
	}

	cout << ANSI_ENTER_ALTERNATE_SCREEN;
	cout.flush();
}

void TerminalSettings::restore() {
	if (mRestored) {
		return;
	}

	mRestored = true;
	cout << ANSI_LEAVE_ALTERNATE_SCREEN;
	cout.flush();

	if (tcsetattr(mFd, TCSAFLUSH, &mOrig) != 0) {
		spdlog::warn("Failed to restore terminal settings: {}", strerror(errno));
	}
}

size_t console_width() {
	struct winsize w;
	if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
		return w.ws_col;
	}

	return 0;
}

void on_resize(int) {}

void install_resize_handler() {
	struct sigaction action = {};
	action.sa_handler = on_resize;
	sigemptyset(&action.sa_mask);
	// No SA_RESTART: the pending read has to return so that the frame is redrawn.
	action.sa_flags = 0;
	if (sigaction(SIGWINCH, &action, nullptr) != 0) {
		throw runtime_error{format("Cannot install resize handler: {}", strerror(errno))};
	}
}

size_t cells_width(const vector<TaggedChar>& cells) {
	size_t width = 0;
	for (const auto& c : cells) {
		width += char_width(c.character);
	}

	return width;
}

vector<vector<TaggedChar>> wrap_text(const vector<TaggedChar>& text, size_t width) {
	vector<vector<TaggedChar>> lines;
	if (width == 0) {
		lines.push_back(text);
		return lines;
	}

	vector<vector<TaggedChar>> words(1);
	for (const auto& c : text) {
		if (c.tag == CharTag::Separator) {
			words.emplace_back();
		} else {
			words.back().push_back(c);
		}
	}

	vector<TaggedChar> line;
	size_t line_width = 0;
	for (const auto& word : words) {
		size_t word_width = cells_width(word);

		// If the word is longer than width, break it up
		if (word_width > width) {
			if (!line.empty()) {
				lines.push_back(line);
				line.clear();
				line_width = 0;
			}

			for (const auto& c : word) {
				size_t w = char_width(c.character);
				if (line_width + w > width && !line.empty()) {
					lines.push_back(line);
					line.clear();
					line_width = 0;
				}

				line.push_back(c);
				line_width += w;
			}

			continue;
		}

		// Normal word handling
		if (line.empty()) {
			line = word;
			line_width = word_width;
		} else if (line_width + 1 + word_width <= width) {
			line.push_back({U' ', CharTag::Separator});
			line.insert(line.end(), word.begin(), word.end());
			line_width += 1 + word_width;
		} else {
			lines.push_back(line);
			line = word;
			line_width = word_width;
		}
	}

	if (!line.empty()) {
		lines.push_back(line);
	}

	return lines;
}

string repeat(const string& str, size_t n) {
	string result;
	for (size_t i = 0; i < n; i++) {
		result += str;
	}

	return result;
}

string border_row(const string& left, const string& right, const string& label, size_t label_width, size_t width, bool centered) {
	size_t fill = width > label_width + 2 ? width - label_width - 2 : 0;
	size_t left_fill = centered ? fill / 2 : 0;
	return left + repeat("─", left_fill) + label + repeat("─", fill - left_fill) + right;
}

const string& tag_style(CharTag tag) {
	switch (tag) {
		case CharTag::Matched: return ANSI_MATCHED;
		case CharTag::Mismatched: return ANSI_MISMATCHED;
		default: return ANSI_PENDING;
	}
}

string styled_line(const vector<TaggedChar>& line) {
	string result;
	const string* current = nullptr;
	for (const auto& c : line) {
		const string& style = tag_style(c.tag);
		if (current != &style) {
			result += style;
			current = &style;
		}

		result += encode_utf8(c.character);
	}

	return result + ANSI_RESET;
}

string draw_frame(const DisplayModel& model, size_t width) {
	width = max(width, MIN_FRAME_WIDTH);

	// Boxes sit inside the outer border with one column of padding on either side
	size_t box_width = width - 4;
	size_t content_width = box_width - 2;

	vector<string> rows;
	auto add_boxed = [&rows](const string& row) { rows.emplace_back("│ " + row + " │"); };

	size_t title_width = display_width(decode_utf8(model.title));
	rows.emplace_back(border_row("┌", "┐", ANSI_TITLE + model.title + ANSI_RESET, title_width, width, true));

	add_boxed(border_row("┌", "┐", WORDS_BOX_TITLE, WORDS_BOX_TITLE.size(), box_width, false));
	auto lines = wrap_text(model.text, content_width);
	if (lines.empty()) {
		lines.emplace_back();
	}

	for (const auto& line : lines) {
		size_t line_width = cells_width(line);
		size_t padding = content_width > line_width ? content_width - line_width : 0;
		add_boxed("│" + string(padding / 2, ' ') + styled_line(line) + string(padding - padding / 2, ' ') + "│");
	}

	add_boxed(border_row("└", "┘", "", 0, box_width, false));

	add_boxed(border_row("┌", "┐", WPM_BOX_TITLE, WPM_BOX_TITLE.size(), box_width, false));
	size_t label_width = display_width(decode_utf8(model.wpm_label));
	size_t padding = content_width > label_width ? content_width - label_width : 0;
	add_boxed("│" + ANSI_WPM + model.wpm_label + ANSI_RESET + string(padding, ' ') + "│");
	add_boxed(border_row("└", "┘", "", 0, box_width, false));

	rows.emplace_back(border_row("└", "┘", "", 0, width, false));

	string frame = ANSI_CURSOR_HOME;
	for (size_t i = 0; i < rows.size(); i++) {
		frame += rows[i] + ANSI_CLEAR_TO_END_OF_LINE;
		if (i < rows.size() - 1) {
			frame += "\r\n";
		}
	}

	return frame + ANSI_CLEAR_TO_END_OF_SCREEN;
}

} // namespace teaty
