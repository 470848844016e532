// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include "clock.h"
#include "input.h"
#include "random_source.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace teaty {

const size_t SAMPLE_SIZE = 10;

struct Session {
	std::vector<std::u32string> target_words;
	// Append-only until the next reset
	std::u32string input;
	// Set by the first typed character
	std::optional<Clock::time_point> start_time;
	std::vector<uint32_t> wpm_history;
};

// Words per minute with the customary five characters per word.
uint32_t compute_wpm(size_t n_chars, int64_t elapsed_seconds);

uint32_t current_wpm(const Session& session);

class SessionManager {
public:
	// Throws std::invalid_argument if the corpus has fewer than SAMPLE_SIZE distinct words.
	SessionManager(std::vector<std::u32string> corpus, RandomSource& random, const Clock& clock);

	const Session& session() const { return mSession; }
	bool running() const { return mRunning; }

	void apply(const InputAction& action);

	// Replaces the session with a fresh word sample, clearing input, timer and history.
	void initialize();
	void apply_character(char32_t c);
	void apply_reset();
	void quit();

	// Appends the WPM over the whole elapsed seconds since the first keystroke, once at least one second has
	// passed. Every call appends, so the history repeats values within the same second.
	void tick();

	uint32_t current_wpm() const { return teaty::current_wpm(mSession); }

private:
	std::vector<std::u32string> mCorpus;
	RandomSource& mRandom;
	const Clock& mClock;

	Session mSession;
	bool mRunning = true;
};

} // namespace teaty
