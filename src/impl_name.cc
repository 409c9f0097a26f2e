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

#include "impl_name.hh"
#include "errors.hh"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <vector>

using namespace rsfuse;

static bool is_space(char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_ident_char(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string rsfuse::strip_whitespace(std::string_view text) {
	std::string result;
	result.reserve(text.size());
	for (auto c : text) {
		if (!is_space(c)) {
			result.push_back(c);
		}
	}
	return result;
}

std::vector<std::string> rsfuse::path_segments(std::string_view type_text) {
	auto trim = [](std::string_view &s) {
		while (!s.empty() && is_space(s.front())) {
			s.remove_prefix(1);
		}
	};
	auto s = type_text;
	trim(s);
	while (!s.empty()) {
		if (s.front() == '&' || s.front() == '*') {
			s.remove_prefix(1);
		} else if (s.front() == '\'') {
			s.remove_prefix(1);
			while (!s.empty() && is_ident_char(s.front())) {
				s.remove_prefix(1);
			}
		} else if (s.starts_with("mut ") || s.starts_with("dyn ") ||
				   s.starts_with("const ")) {
			s.remove_prefix(s.find(' '));
		} else {
			break;
		}
		trim(s);
	}
	auto end = std::find_if(s.begin(), s.end(), [](char c) {
		return c == '<' || c == '(' || is_space(c);
	});
	s = s.substr(0, end - s.begin());

	std::vector<std::string> segments;
	while (!s.empty()) {
		auto separator = s.find("::");
		auto segment = s.substr(0, separator);
		if (!segment.empty()) {
			segments.emplace_back(segment);
		}
		if (separator == std::string_view::npos) {
			break;
		}
		s.remove_prefix(separator + 2);
	}
	return segments;
}

std::string rsfuse::path_base_name(std::string_view type_text) {
	auto segments = path_segments(type_text);
	if (segments.empty()) {
		return "";
	}
	return segments.back();
}

namespace {
	// Recursive descent over `impl<..> [Trait for] Type [where ..]`.
	class NameParser {
	public:
		explicit NameParser(std::string_view text) : text(text) {}

		ImplBlockName parse_block_name() {
			skip_whitespace();
			if (!text.substr(pos).starts_with("impl")) {
				fail("expected keyword 'impl'");
			}
			pos += 4;
			if (!at_end() && !is_space(text[pos]) && text[pos] != '<') {
				fail("expected '<' or whitespace after 'impl'");
			}
			skip_whitespace();

			ImplBlockName name;
			if (!at_end() && text[pos] == '<') {
				name.generics = read_word(true);
			}

			std::vector<std::string> words;
			skip_whitespace();
			while (!at_end()) {
				words.push_back(read_word(false));
				skip_whitespace();
			}
			if (words.empty()) {
				fail("missing type path");
			}

			size_t type_start = 0;
			auto for_it = std::find(words.begin(), words.end(), "for");
			if (for_it != words.end()) {
				if (for_it == words.begin()) {
					fail("missing trait path before 'for'");
				}
				name.trait_path = join(words.begin(), for_it);
				type_start = (for_it - words.begin()) + 1;
			}
			if (type_start >= words.size()) {
				fail("missing type path");
			}
			if (words[type_start].starts_with("where")) {
				fail("missing type path before where clause");
			}

			auto where_start = words.size();
			for (auto i = type_start + 1; i < words.size(); i++) {
				if (words[i].starts_with("where")) {
					where_start = i;
					break;
				}
			}
			name.type_path = join(
				words.begin() + type_start, words.begin() + where_start
			);
			name.where_clause =
				join(words.begin() + where_start, words.end());
			return name;
		}

	private:
		bool at_end() const { return pos >= text.size(); }

		void skip_whitespace() {
			while (!at_end() && is_space(text[pos])) {
				pos++;
			}
		}

		// Reads up to the next whitespace outside of brackets. With
		// `single_group`, stops right after the first balanced group.
		std::string read_word(bool single_group) {
			std::string word;
			int depth = 0;
			while (!at_end()) {
				auto c = text[pos];
				if (is_space(c)) {
					if (depth == 0) {
						break;
					}
					pos++;
					continue;
				}
				if (c == '<' || c == '(' || c == '[') {
					depth++;
				} else if (c == ')' || c == ']' ||
						   (c == '>' && !(pos > 0 && text[pos - 1] == '-'))) {
					depth--;
					if (depth < 0) {
						fail(fmt::format("unbalanced '{}'", c));
					}
				}
				word.push_back(c);
				pos++;
				if (single_group && depth == 0) {
					break;
				}
			}
			if (depth != 0) {
				fail("unbalanced brackets");
			}
			return word;
		}

		template <typename It> static std::string join(It begin, It end) {
			std::string result;
			for (auto it = begin; it != end; it++) {
				result += *it;
			}
			return result;
		}

		[[noreturn]] void fail(std::string_view reason) const {
			throw FusionError(
				ErrorKind::invalid_config_pattern,
				fmt::format(
					"'{}' is not a fully qualified impl block name ({}).",
					text,
					reason
				)
			);
		}

		std::string_view text;
		size_t pos = 0;
	};
} // namespace

ImplBlockName rsfuse::ImplBlockName::from_components(
	std::string_view generics,
	std::optional<std::string_view> trait_path,
	std::string_view type_path,
	std::string_view where_clause
) {
	ImplBlockName name;
	name.generics = strip_whitespace(generics);
	if (trait_path.has_value()) {
		name.trait_path = strip_whitespace(*trait_path);
	}
	name.type_path = strip_whitespace(type_path);
	name.where_clause = strip_whitespace(where_clause);
	if (!name.where_clause.empty() &&
		!name.where_clause.starts_with("where")) {
		name.where_clause = "where" + name.where_clause;
	}
	return name;
}

ImplBlockName rsfuse::ImplBlockName::parse(std::string_view text) {
	NameParser parser(text);
	return parser.parse_block_name();
}

std::string rsfuse::ImplBlockName::to_string() const {
	std::string result = "impl" + generics;
	if (trait_path.has_value()) {
		result += fmt::format(" {} for", *trait_path);
	}
	result += " " + type_path;
	if (!where_clause.empty()) {
		result += " " + where_clause;
	}
	return result;
}

std::string rsfuse::ImplItemPattern::to_string() const {
	if (!block.has_value()) {
		return item_name;
	}
	return fmt::format("{}@{}", item_name, block->to_string());
}

ImplItemPattern rsfuse::ImplItemPattern::parse(std::string_view text) {
	auto invalid = [&](std::string_view reason) {
		return FusionError(
			ErrorKind::invalid_config_pattern,
			fmt::format("Invalid impl item pattern '{}': {}.", text, reason)
		);
	};

	ImplItemPattern pattern;
	auto at = text.find('@');
	auto name_part = text.substr(0, at);
	if (at != std::string_view::npos) {
		auto block_part = text.substr(at + 1);
		if (block_part.find('@') != std::string_view::npos) {
			throw invalid("more than one '@'");
		}
		pattern.block = ImplBlockName::parse(block_part);
	}

	auto first = name_part.find_first_not_of(" \t");
	auto last = name_part.find_last_not_of(" \t");
	if (first == std::string_view::npos) {
		throw invalid("missing impl item name");
	}
	pattern.item_name = std::string{name_part.substr(first, last - first + 1)};
	if (pattern.is_wildcard()) {
		if (!pattern.block.has_value()) {
			throw invalid(
				"wildcard '*' requires a fully qualified impl block name"
			);
		}
		return pattern;
	}
	if (!std::all_of(
			pattern.item_name.begin(), pattern.item_name.end(), is_ident_char
		)) {
		throw invalid("impl item name is not an identifier");
	}
	return pattern;
}
