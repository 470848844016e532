// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "session.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <type_traits>

using namespace std;

namespace teaty {

uint32_t compute_wpm(size_t n_chars, int64_t elapsed_seconds) {
	if (elapsed_seconds <= 0) {
		return 0;
	}

	double wpm = (n_chars / 5.0) * (60.0 / elapsed_seconds);
	return static_cast<uint32_t>(wpm);
}

uint32_t current_wpm(const Session& session) { return session.wpm_history.empty() ? 0 : session.wpm_history.back(); }

SessionManager::SessionManager(vector<u32string> corpus, RandomSource& random, const Clock& clock) :
	mCorpus{std::move(corpus)}, mRandom{random}, mClock{clock} {
	initialize();
}

void SessionManager::apply(const InputAction& action) {
	visit(
		[this](const auto& a) {
			using T = decay_t<decltype(a)>;
			if constexpr (is_same_v<T, CharacterTyped>) {
				apply_character(a.character);
			} else if constexpr (is_same_v<T, Reset>) {
				apply_reset();
			} else if constexpr (is_same_v<T, Quit>) {
				quit();
			}
		},
		action
	);
}

void SessionManager::initialize() {
	mSession = Session{
		.target_words = sample_words(mCorpus, SAMPLE_SIZE, mRandom),
		.input = {},
		.start_time = nullopt,
		.wpm_history = {},
	};
}

void SessionManager::apply_character(char32_t c) {
	if (!mSession.start_time) {
		mSession.start_time = mClock.now();
		spdlog::debug("Timer started");
	}

	mSession.input.push_back(c);
}

void SessionManager::apply_reset() {
	spdlog::debug("Resetting session after {} characters", mSession.input.size());
	initialize();
}

void SessionManager::quit() { mRunning = false; }

void SessionManager::tick() {
	if (!mSession.start_time) {
		return;
	}

	int64_t elapsed = chrono::duration_cast<chrono::seconds>(mClock.now() - *mSession.start_time).count();
	if (elapsed > 0) {
		mSession.wpm_history.push_back(compute_wpm(mSession.input.size(), elapsed));
	}
}

} // namespace teaty
