// This file was developed by Thomas Müller <contact@tom94.net>.
// It is published under the GPLv3 License; see the LICENSE file.

#include "clock.h"
#include "common.h"
#include "corpus.h"
#include "input.h"
#include "options.h"
#include "random_source.h"
#include "render.h"
#include "session.h"
#include "terminal.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <clocale>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace std;

namespace teaty {

void setup_logging() {
	spdlog::set_default_logger(spdlog::stderr_color_mt("teaty"));
	spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
	spdlog::set_level(spdlog::level::warn);
	spdlog::cfg::load_env_levels();
}

size_t frame_width() {
	size_t width = console_width();
	return width == 0 ? DEFAULT_FRAME_WIDTH : width;
}

int main(const vector<string>& args) {
	Options options = parse_options(args);
	if (options.help) {
		print_help();
		return 0;
	} else if (options.version) {
		print_version();
		return 0;
	}

	auto corpus = load_word_list(options.word_list_name);

	unique_ptr<RandomSource> random;
	if (options.seed) {
		spdlog::info("Sampling words with seed {}", *options.seed);
		random = make_unique<MersenneTwisterSource>(*options.seed);
	} else {
		random = make_unique<MersenneTwisterSource>();
	}

	SteadyClock clock;
	SessionManager manager{std::move(corpus), *random, clock};

	// Determine the interactive input file descriptor.
	int input_fd;
	if (isatty(STDIN_FILENO)) {
		input_fd = STDIN_FILENO;
	} else {
		input_fd = open("/dev/tty", O_RDONLY);
		if (input_fd < 0) {
			throw runtime_error{"Cannot open /dev/tty"};
		}
	}

	ScopeGuard guard{[&input_fd] {
		if (input_fd != STDIN_FILENO) {
			close(input_fd);
		}
	}};

	install_resize_handler();

	// The terminal settings object enables raw input mode and automatically reverts to default settings when destructed
	TerminalSettings term{input_fd};
	TerminalInput input{input_fd};

	while (manager.running()) {
		cout << draw_frame(project(manager.session()), frame_width());
		cout.flush();

		manager.apply(input.next_action());
		manager.tick();
	}

	term.restore();
	cout << format_summary(summarize(manager.session())) << endl;

	return 0;
}

} // namespace teaty

int main(int argc, char* argv[]) {
	setlocale(LC_ALL, "en_US.UTF-8");

	try {
		teaty::setup_logging();

		// This accelerates I/O significantly by allowing C++ to perform its own buffering.
		ios::sync_with_stdio(false);

		vector<string> arguments;
		for (int i = 0; i < argc; ++i) {
			arguments.emplace_back(argv[i]);
		}

		return teaty::main(arguments);
	} catch (const exception& e) {
		spdlog::error("{}", e.what());
		return 1;
	}
}
