// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "render.h"

#include <algorithm>
#include <format>

using namespace std;

namespace teaty {

CharTag tag_at(const u32string& input, size_t position, char32_t target) {
	if (position >= input.size()) {
		return CharTag::Pending;
	}

	return input[position] == target ? CharTag::Matched : CharTag::Mismatched;
}

DisplayModel project(const Session& session) {
	DisplayModel model;
	model.title = TITLE;

	for (size_t i = 0; i < session.target_words.size(); i++) {
		const u32string& word = session.target_words[i];
		if (i > 0) {
			model.text.push_back({U' ', CharTag::Separator});
		}

		for (size_t j = 0; j < word.size(); j++) {
			model.text.push_back({word[j], tag_at(session.input, i * (word.size() + 1) + j, word[j])});
		}
	}

	model.wpm_label = format("WPM: {}", current_wpm(session));
	return model;
}

double Summary::accuracy() const {
	size_t n_compared = n_matched + n_mismatched;
	if (n_compared == 0) {
		return 0.0;
	}

	return (static_cast<double>(n_matched) / n_compared) * 100.0;
}

Summary summarize(const Session& session) {
	Summary summary;
	summary.n_typed = session.input.size();
	summary.final_wpm = current_wpm(session);
	if (!session.wpm_history.empty()) {
		summary.peak_wpm = *max_element(session.wpm_history.begin(), session.wpm_history.end());
	}

	for (const auto& c : project(session).text) {
		if (c.tag == CharTag::Matched) {
			++summary.n_matched;
		} else if (c.tag == CharTag::Mismatched) {
			++summary.n_mismatched;
		}
	}

	return summary;
}

string format_summary(const Summary& summary) {
	if (summary.n_typed == 0) {
		return "Cancelled.";
	}

	double accuracy = summary.accuracy();
	return format(
		"Characters: {}, WPM: {}, Peak WPM: {}, Accuracy: {:.2f}% {}",
		summary.n_typed,
		summary.final_wpm,
		summary.peak_wpm,
		accuracy,
		accuracy == 100 ? "🎉" : ""
	);
}

} // namespace teaty
