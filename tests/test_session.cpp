// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "helpers.h"
#include "session.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace std;
using namespace std::chrono_literals;
using namespace teaty;

TEST_CASE("session_initialize_samples_distinct_words") {
	MersenneTwisterSource random{42};
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	const auto& words = manager.session().target_words;
	REQUIRE(words.size() == SAMPLE_SIZE);

	// drawn without repetition, from the corpus only
	set<u32string> distinct(words.begin(), words.end());
	REQUIRE(distinct.size() == SAMPLE_SIZE);

	auto corpus = twelve_words();
	for (const auto& word : words) {
		REQUIRE(find(corpus.begin(), corpus.end(), word) != corpus.end());
	}

	// fresh session
	REQUIRE(manager.session().input.empty());
	REQUIRE(!manager.session().start_time);
	REQUIRE(manager.session().wpm_history.empty());
	REQUIRE(manager.running());
}

TEST_CASE("session_sample_follows_random_source") {
	ManualClock clock;

	// all-zero draws keep the corpus order
	ScriptedRandom zeros;
	SessionManager in_order{twelve_words(), zeros, clock};
	auto corpus = twelve_words();
	REQUIRE(in_order.session().target_words == vector<u32string>(corpus.begin(), corpus.begin() + SAMPLE_SIZE));

	// first draw picks the last word, which swaps "hello" to the back
	ScriptedRandom last_first{11};
	SessionManager swapped{twelve_words(), last_first, clock};
	REQUIRE(swapped.session().target_words[0] == U"accuracy");
	REQUIRE(swapped.session().target_words[1] == U"world");
	REQUIRE(swapped.session().target_words[9] == U"challenge");
}

TEST_CASE("session_requires_enough_words") {
	ScriptedRandom random;
	ManualClock clock;

	auto corpus = twelve_words();
	corpus.resize(SAMPLE_SIZE - 1);
	REQUIRE_THROWS_AS((SessionManager{corpus, random, clock}), invalid_argument);

	corpus = twelve_words();
	corpus.resize(SAMPLE_SIZE);
	REQUIRE_NOTHROW((SessionManager{corpus, random, clock}));
}

TEST_CASE("session_apply_character_is_append_only") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	manager.apply_character(U'h');
	manager.apply_character(U'x');
	REQUIRE(manager.session().input == U"hx");

	// mismatches are recorded, not rejected
	manager.apply_character(U'!');
	REQUIRE(manager.session().input == U"hx!");
	REQUIRE(manager.session().input.size() == 3);
}

TEST_CASE("session_start_time_set_once") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	REQUIRE(!manager.session().start_time);

	auto first = clock.now();
	manager.apply_character(U'h');
	REQUIRE(manager.session().start_time == first);

	clock.advance(3s);
	manager.apply_character(U'e');
	REQUIRE(manager.session().start_time == first);
}

TEST_CASE("session_wpm_formula") {
	REQUIRE(compute_wpm(25, 10) == 30);
	REQUIRE(compute_wpm(5, 2) == 30);
	REQUIRE(compute_wpm(10, 1) == 120);

	// truncated, not rounded: 2.4 * 8.57 = 20.57
	REQUIRE(compute_wpm(12, 7) == 20);

	// zero characters
	REQUIRE(compute_wpm(0, 5) == 0);

	// no elapsed time
	REQUIRE(compute_wpm(25, 0) == 0);
}

TEST_CASE("session_tick_without_start_or_elapsed_second") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	// nothing typed yet
	clock.advance(5s);
	manager.tick();
	REQUIRE(manager.session().wpm_history.empty());
	REQUIRE(manager.current_wpm() == 0);

	// under a whole second since the first keystroke
	manager.apply_character(U'h');
	clock.advance(999ms);
	manager.tick();
	REQUIRE(manager.session().wpm_history.empty());

	clock.advance(1ms);
	manager.tick();
	REQUIRE(manager.session().wpm_history == vector<uint32_t>{12});
}

TEST_CASE("session_tick_appends_every_call") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	for (int i = 0; i < 25; i++) {
		manager.apply_character(U'a');
	}

	clock.advance(10s);
	manager.tick();
	REQUIRE(manager.current_wpm() == 30);

	// same whole second, same value appended again
	clock.advance(500ms);
	manager.tick();
	REQUIRE(manager.session().wpm_history == vector<uint32_t>{30, 30});

	// elapsed is truncated to whole seconds
	clock.advance(500ms);
	manager.tick();
	REQUIRE(manager.session().wpm_history.back() == compute_wpm(25, 11));
}

TEST_CASE("session_reset_restores_fresh_state") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	manager.apply_character(U'h');
	manager.apply_character(U'e');
	clock.advance(2s);
	manager.tick();
	REQUIRE(!manager.session().wpm_history.empty());

	manager.apply_reset();
	REQUIRE(manager.session().input.empty());
	REQUIRE(!manager.session().start_time);
	REQUIRE(manager.session().wpm_history.empty());
	REQUIRE(manager.session().target_words.size() == SAMPLE_SIZE);
	REQUIRE(manager.current_wpm() == 0);

	// the timer starts over with the next keystroke
	manager.apply_character(U'w');
	REQUIRE(manager.session().start_time == clock.now());
	REQUIRE(manager.running());
}

TEST_CASE("session_reset_resamples_words") {
	ScriptedRandom random{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 11};
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};
	REQUIRE(manager.session().target_words[0] == U"hello");

	manager.apply_reset();
	REQUIRE(manager.session().target_words[0] == U"accuracy");
}

TEST_CASE("session_apply_dispatches_actions") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	manager.apply(CharacterTyped{U'q'});
	REQUIRE(manager.session().input == U"q");

	manager.apply(Ignored{});
	REQUIRE(manager.session().input == U"q");
	REQUIRE(manager.running());

	manager.apply(Reset{});
	REQUIRE(manager.session().input.empty());
	REQUIRE(manager.running());

	manager.apply(Quit{});
	REQUIRE(!manager.running());
}

TEST_CASE("session_end_to_end") {
	ScriptedRandom random;
	ManualClock clock;
	SessionManager manager{twelve_words(), random, clock};

	for (char32_t c : u32string{U"hello"}) {
		manager.apply(CharacterTyped{c});
		manager.tick();
	}

	REQUIRE(manager.current_wpm() == 0);

	clock.advance(2s);
	manager.tick();
	REQUIRE(manager.current_wpm() == 30);
	REQUIRE(current_wpm(manager.session()) == 30);
}
