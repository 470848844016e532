// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace teaty {

class RandomSource {
public:
	virtual ~RandomSource() = default;

	// Uniformly distributed index in [0, bound). Callers guarantee bound > 0.
	virtual size_t next_index(size_t bound) = 0;
};

class MersenneTwisterSource : public RandomSource {
public:
	// Seeded from std::random_device
	MersenneTwisterSource();
	explicit MersenneTwisterSource(uint32_t seed);

	size_t next_index(size_t bound) override;

private:
	std::mt19937 mGenerator;
};

// Picks n distinct entries of corpus (partial Fisher-Yates), in the order they were drawn.
std::vector<std::u32string> sample_words(const std::vector<std::u32string>& corpus, size_t n, RandomSource& random);

} // namespace teaty
