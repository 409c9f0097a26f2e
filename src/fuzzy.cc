// From rsfuse

// MIT License

// Copyright (c) 2025 Silimate Inc.

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "fuzzy.hh"

#include <algorithm>
#include <cctype>
#include <limits>

using namespace rsfuse;

namespace {
	constexpr int score_match = 16;
	constexpr int gap_start = 3;
	constexpr int gap_extension = 1;
	constexpr int bonus_boundary = 8;
	constexpr int bonus_camel = 7;
	constexpr int bonus_consecutive = 4;
	constexpr int no_match = std::numeric_limits<int>::min() / 4;

	bool is_word(char c) {
		return std::isalnum(static_cast<unsigned char>(c)) != 0;
	}

	int position_bonus(std::string_view text, size_t j) {
		if (j == 0 || !is_word(text[j - 1])) {
			return bonus_boundary;
		}
		if (std::islower(static_cast<unsigned char>(text[j - 1])) &&
			std::isupper(static_cast<unsigned char>(text[j]))) {
			return bonus_camel;
		}
		return 0;
	}
} // namespace

std::optional<int>
rsfuse::fuzzy_score(std::string_view text, std::string_view query) {
	if (query.empty()) {
		return 0;
	}
	bool case_sensitive = std::any_of(query.begin(), query.end(), [](char c) {
		return std::isupper(static_cast<unsigned char>(c));
	});
	auto equal = [&](char a, char b) {
		if (case_sensitive) {
			return a == b;
		}
		return std::tolower(static_cast<unsigned char>(a)) ==
			   std::tolower(static_cast<unsigned char>(b));
	};

	auto n = text.size();
	auto m = query.size();
	if (m > n) {
		return std::nullopt;
	}

	// previous[j]: best score with the previous query character at text[j]
	std::vector<int> previous(n, no_match);
	std::vector<int> current(n, no_match);
	for (size_t j = 0; j < n; j++) {
		if (equal(text[j], query[0])) {
			previous[j] = score_match + position_bonus(text, j);
		}
	}

	for (size_t i = 1; i < m; i++) {
		std::fill(current.begin(), current.end(), no_match);
		int gap_best = no_match;
		for (size_t j = 1; j < n; j++) {
			if (j >= 2) {
				gap_best = std::max(
					gap_best - gap_extension, previous[j - 2] - gap_start
				);
			}
			if (!equal(text[j], query[i])) {
				continue;
			}
			auto consecutive = previous[j - 1] + bonus_consecutive;
			auto best = std::max(consecutive, gap_best);
			if (best <= no_match / 2) {
				continue;
			}
			current[j] = best + score_match + position_bonus(text, j);
		}
		std::swap(previous, current);
	}

	auto best = *std::max_element(previous.begin(), previous.end());
	if (best <= no_match / 2) {
		return std::nullopt;
	}
	return best;
}

std::vector<FuzzyMatch> rsfuse::fuzzy_rank(
	const std::vector<std::string> &options, std::string_view query
) {
	std::vector<FuzzyMatch> matches;
	for (size_t i = 0; i < options.size(); i++) {
		if (auto score = fuzzy_score(options[i], query)) {
			matches.push_back({i, *score});
		}
	}
	std::stable_sort(
		matches.begin(),
		matches.end(),
		[](const FuzzyMatch &a, const FuzzyMatch &b) {
			return a.score > b.score;
		}
	);
	return matches;
}
