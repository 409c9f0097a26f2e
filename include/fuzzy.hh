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

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	/**
	 * @brief Scores `text` against a typed query.
	 *
	 * Every character of the query has to occur in `text` in order. Matches
	 * at word boundaries and runs of consecutive matches score higher, gaps
	 * between matches cost. Matching ignores case unless the query contains
	 * an upper case letter.
	 *
	 * @returns std::nullopt if `text` does not contain the query as a
	 *  subsequence. An empty query matches with score 0.
	 */
	std::optional<int> fuzzy_score(std::string_view text, std::string_view query);

	struct FuzzyMatch {
		size_t index = 0; // into the ranked options
		int score = 0;
	};

	// Matching options, best first. Equal scores keep their original order.
	std::vector<FuzzyMatch>
	fuzzy_rank(const std::vector<std::string> &options, std::string_view query);
} // namespace rsfuse
