// This file was developed by Thomas Müller <contact@tom94.net>.
// It is published under the GPLv3 License; see the LICENSE file.

#include "options.h"

#include <format>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace std;

namespace teaty {

Options parse_options(const vector<string>& args) {
	Options options;
	for (size_t i = 1; i < args.size(); i++) {
		const string& arg = args[i];
		if (arg == "-h" || arg == "--help") {
			options.help = true;
		} else if (arg == "-v" || arg == "--version") {
			options.version = true;
		} else if (arg == "-l" || arg == "--list") {
			if (i + 1 >= args.size() || args[i + 1].starts_with('-')) {
				throw invalid_argument{format("Missing word list name. Available lists: {}", available_word_lists())};
			}

			options.word_list_name = args[++i];
		} else if (arg == "-s" || arg == "--seed") {
			if (i + 1 >= args.size()) {
				throw invalid_argument{"Missing seed"};
			}

			const string& value = args[++i];
			unsigned long seed;
			try {
				size_t n_parsed;
				seed = stoul(value, &n_parsed);
				if (n_parsed != value.size() || value.starts_with('-')) {
					throw invalid_argument{value};
				}
			} catch (const logic_error&) { throw invalid_argument{format("Invalid seed provided: {}", value)}; }

			if (seed > numeric_limits<uint32_t>::max()) {
				throw invalid_argument{format("Seed must not exceed {}", numeric_limits<uint32_t>::max())};
			}

			options.seed = static_cast<uint32_t>(seed);
		} else {
			throw invalid_argument{format("Unknown option: {}", arg)};
		}
	}

	return options;
}

void print_help() {
	cout << "Usage: teaty [OPTIONS]\n"
		 << "A terminal-based typing speed test.\n"
		 << "\n"
		 << "Options:\n"
		 << "  -h, --help         Show this help message and exit\n"
		 << "  -v, --version      Show version information and exit\n"
		 << "  -l, --list NAME    Word list to sample from (" << available_word_lists() << ")\n"
		 << "  -s, --seed N       Seed for a reproducible word sample\n"
		 << "\n"
		 << "Type the words shown. Press Ctrl-R to restart with new words, ESC or Ctrl-C to quit.\n"
		 << "Set SPDLOG_LEVEL (e.g. debug) to change the log level; logs go to stderr.\n";
	cout.flush();
}

void print_version() { cout << "teaty — terminal typing speed test" << endl << "version " << TEATY_VERSION << endl; }

} // namespace teaty
