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

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	struct RuleSet {
		std::vector<std::string> include;
		std::vector<std::string> exclude;

		bool empty() const { return include.empty() && exclude.empty(); }
	};

	/**
	 * @brief Operator decisions on impl items and impl blocks.
	 *
	 * `impl_items` entries are patterns (`name`, `name@block`, `*@block`);
	 * `impl_blocks` entries are fully qualified impl block names. The value
	 * is passed explicitly to every stage that consults it.
	 */
	struct Configuration {
		RuleSet impl_items;
		RuleSet impl_blocks;

		bool empty() const { return impl_items.empty() && impl_blocks.empty(); }

		// Union per list.
		void merge(const Configuration &other);
		// Sorts every list and removes duplicates.
		void normalize();

		/**
		 * @brief Reads the `[impl_items]` and `[impl_blocks]` tables.
		 *
		 * @exception rsfuse::FusionError (InputError) if the document does
		 * not have the shape of a configuration.
		 */
		static Configuration from_toml(const toml::table &table);
		toml::table to_toml() const;

		/**
		 * @exception rsfuse::FusionError (InputError) for TOML syntax errors
		 * and wrong shapes. `source` names the text in messages.
		 */
		static Configuration
		parse(std::string_view text, std::string_view source = "");

		// Cache fingerprint form.
		nlohmann::json to_json() const;

		/**
		 * @exception rsfuse::FusionError (InputError) if the file cannot be
		 * read or parsed.
		 */
		static Configuration load(const std::filesystem::path &path);
		void save(const std::filesystem::path &path) const;
	};
} // namespace rsfuse
