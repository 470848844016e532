// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include "session.h"

#include <cstdint>
#include <string>
#include <vector>

namespace teaty {

const std::string TITLE = "Teaty Typing Speed Test";

enum class CharTag {
	Matched,
	Mismatched,
	Pending,
	// Space joining two target words; never compared
	Separator,
};

struct TaggedChar {
	char32_t character;
	CharTag tag;
};

struct DisplayModel {
	std::string title;
	std::vector<TaggedChar> text;
	std::string wpm_label;
};

CharTag tag_at(const std::u32string& input, size_t position, char32_t target);

// Word i, character j is compared against input[i * (len(word i) + 1) + j], as if every word, the last one
// included, were followed by one separator.
DisplayModel project(const Session& session);

struct Summary {
	size_t n_typed = 0;
	size_t n_matched = 0;
	size_t n_mismatched = 0;
	uint32_t final_wpm = 0;
	uint32_t peak_wpm = 0;

	double accuracy() const;
};

Summary summarize(const Session& session);

std::string format_summary(const Summary& summary);

} // namespace teaty
