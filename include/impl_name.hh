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
	std::string strip_whitespace(std::string_view text);

	// {"map", "MyMap2D"} for "&'a mut map::MyMap2D<T, X>"
	std::vector<std::string> path_segments(std::string_view type_text);
	std::string path_base_name(std::string_view type_text);

	/**
	 * @brief The fully qualified name of an impl block.
	 *
	 * Up to four components, each stored without whitespace:
	 *
	 *   impl<generics> [trait_path for] type_path [where_clause]
	 *
	 * The rendered form joins the components with a single space, e.g.
	 * `impl<T:Copy,constN:usize> Default for MyArray<T,N> whereT:Display`.
	 */
	struct ImplBlockName {
		std::string generics;                  // "<T:Copy>" or empty
		std::optional<std::string> trait_path; // "fmt::Display"
		std::string type_path;                 // "MyMap2D<T,X,Y,N>"
		std::string where_clause;              // "whereT:Copy" or empty

		/**
		 * @brief Builds the name from the raw component texts of an impl
		 * header as found in the source.
		 */
		static ImplBlockName from_components(
			std::string_view generics,
			std::optional<std::string_view> trait_path,
			std::string_view type_path,
			std::string_view where_clause
		);

		/**
		 * @brief Parses a fully qualified impl block name as written in a
		 * configuration entry.
		 *
		 * Whitespace inside a component is insignificant; components are
		 * recognized by the leading `impl` keyword, the `for` keyword and a
		 * trailing component starting with `where`.
		 *
		 * @exception rsfuse::FusionError (InvalidConfigPattern) if the text
		 * is not an impl block name.
		 */
		static ImplBlockName parse(std::string_view text);

		std::string to_string() const;
		bool has_trait() const { return trait_path.has_value(); }

		bool operator==(const ImplBlockName &) const = default;
	};

	/**
	 * @brief An `impl_items` configuration entry:
	 * `name`, `name@block` or `*@block`.
	 */
	struct ImplItemPattern {
		std::string item_name;
		std::optional<ImplBlockName> block;

		bool is_wildcard() const { return item_name == "*"; }
		std::string to_string() const;

		/**
		 * @exception rsfuse::FusionError (InvalidConfigPattern) for an empty
		 * or malformed name, more than one `@`, or a wildcard without block.
		 */
		static ImplItemPattern parse(std::string_view text);
	};
} // namespace rsfuse
