// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include "clock.h"
#include "common.h"
#include "random_source.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace teaty {

// Replays scripted draws (clamped into range); 0 once the script runs out.
class ScriptedRandom : public RandomSource {
public:
	ScriptedRandom() = default;
	ScriptedRandom(std::initializer_list<size_t> draws) : mDraws{draws} {}

	size_t next_index(size_t bound) override {
		if (mDraws.empty()) {
			return 0;
		}

		size_t draw = mDraws.front();
		mDraws.pop_front();
		return draw % bound;
	}

private:
	std::deque<size_t> mDraws;
};

class ManualClock : public Clock {
public:
	time_point now() const override { return mNow; }

	template <typename Rep, typename Period> void advance(std::chrono::duration<Rep, Period> duration) {
		mNow += std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
	}

private:
	time_point mNow{std::chrono::hours{1}};
};

inline std::vector<std::u32string> twelve_words() {
	return {
		U"hello", U"world", U"rust", U"speed", U"test", U"keyboard",
		U"fast", U"typing", U"game", U"challenge", U"performance", U"accuracy",
	};
}

} // namespace teaty

namespace Catch {

template <> struct StringMaker<std::u32string> {
	static std::string convert(const std::u32string& str) { return '"' + teaty::encode_utf8(str) + '"'; }
};

} // namespace Catch
