// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include <string>
#include <vector>

namespace teaty {

const std::string DEFAULT_WORD_LIST = "en";

// Parses a word list document of the form {"name": "...", "words": ["...", ...]}. Words are NFC-normalized;
// empty and repeated words are dropped. Throws std::invalid_argument on malformed documents.
std::vector<std::u32string> parse_word_list(const std::string& document);

// Loads one of the word lists embedded in the binary. Throws std::invalid_argument for unknown names.
std::vector<std::u32string> load_word_list(const std::string& name);

std::string available_word_lists();

} // namespace teaty
