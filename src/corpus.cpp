// This file is part of teaty, a terminal typing speed test.
// It is published under the GPLv3 License; see the LICENSE file.

#include "corpus.h"
#include "common.h"

#include <cmrc/cmrc.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <format>
#include <set>
#include <stdexcept>

using namespace std;
using namespace nlohmann;

CMRC_DECLARE(teaty);

namespace teaty {

const string WORD_LIST_DIR = "resources/words";
const string WORD_LIST_EXTENSION = ".json";

vector<u32string> parse_word_list(const string& document) {
	json list;
	try {
		list = json::parse(document);
	} catch (const json::parse_error& e) { throw invalid_argument{format("Malformed word list: {}", e.what())}; }

	if (!list.is_object() || !list.contains("words") || !list["words"].is_array()) {
		throw invalid_argument{"Word list must be an object with a \"words\" array"};
	}

	if (list.contains("name") && !list["name"].is_string()) {
		throw invalid_argument{format("Word list name must be a string, got {}", list["name"].dump())};
	}

	vector<u32string> words;
	set<u32string> seen;
	for (const auto& entry : list["words"]) {
		if (!entry.is_string()) {
			throw invalid_argument{format("Word list entries must be strings, got {}", entry.dump())};
		}

		u32string word = nfc(entry.get<string>());
		if (word.empty() || !seen.insert(word).second) {
			continue;
		}

		words.push_back(std::move(word));
	}

	spdlog::debug("Parsed word list \"{}\" with {} words", list.value("name", ""), words.size());
	return words;
}

vector<u32string> load_word_list(const string& name) {
	auto fs = cmrc::teaty::get_filesystem();

	string path = format("{}/{}{}", WORD_LIST_DIR, name, WORD_LIST_EXTENSION);
	if (!fs.is_file(path)) {
		throw invalid_argument{format("Invalid word list name provided. Available lists: {}", available_word_lists())};
	}

	auto words_file = fs.open(path);
	return parse_word_list({words_file.cbegin(), words_file.cend()});
}

string available_word_lists() {
	vector<string> names;
	for (const auto& entry : cmrc::teaty::get_filesystem().iterate_directory(WORD_LIST_DIR)) {
		string filename = entry.filename();
		if (entry.is_file() && filename.ends_with(WORD_LIST_EXTENSION)) {
			names.emplace_back(filename.substr(0, filename.size() - WORD_LIST_EXTENSION.size()));
		}
	}

	return join(names, ", ");
}

} // namespace teaty
