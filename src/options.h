// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include "corpus.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace teaty {

struct Options {
	bool help = false;
	bool version = false;
	std::string word_list_name = DEFAULT_WORD_LIST;
	std::optional<uint32_t> seed;
};

// args[0] is the program name. Throws std::invalid_argument on unknown options or malformed values.
Options parse_options(const std::vector<std::string>& args);

void print_help();
void print_version();

} // namespace teaty
