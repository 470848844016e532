// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "random_source.h"

#include <format>
#include <numeric>
#include <stdexcept>

using namespace std;

namespace teaty {

MersenneTwisterSource::MersenneTwisterSource() : mGenerator{random_device{}()} {}

MersenneTwisterSource::MersenneTwisterSource(uint32_t seed) : mGenerator{seed} {}

size_t MersenneTwisterSource::next_index(size_t bound) {
	uniform_int_distribution<size_t> dis(0, bound - 1);
	return dis(mGenerator);
}

vector<u32string> sample_words(const vector<u32string>& corpus, size_t n, RandomSource& random) {
	if (corpus.size() < n) {
		throw invalid_argument{format("Word list has {} words, but {} are needed", corpus.size(), n)};
	}

	vector<size_t> indices(corpus.size());
	iota(indices.begin(), indices.end(), 0);

	vector<u32string> selected_words;
	for (size_t i = 0; i < n; i++) {
		size_t j = i + random.next_index(indices.size() - i);
		swap(indices[i], indices[j]);
		selected_words.push_back(corpus[indices[i]]);
	}

	return selected_words;
}

} // namespace teaty
