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

#include "ast.hh"

#include <slang/text/SourceLocation.h>
#include <slang/text/SourceManager.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rsfuse {
	/**
	 * @brief Reads the crate dump produced by the parser front end.
	 *
	 * Every source file named by a span is loaded once into the source
	 * manager; spans become source ranges into those buffers. Relative file
	 * names are resolved against the directory of the dump.
	 */
	class CrateDumpLoader {
	public:
		explicit CrateDumpLoader(slang::SourceManager &source_manager)
			: source_manager(source_manager) {}

		/**
		 * @exception rsfuse::FusionError (InputError) if the dump or one of
		 * its source files cannot be read, or the dump is malformed.
		 */
		std::vector<CrateNode> load(const std::filesystem::path &path);
		std::vector<CrateNode>
		parse(const nlohmann::json &j, const std::filesystem::path &base_dir);

		// Registers source text under a path without touching the disk.
		slang::BufferID
		add_source(const std::filesystem::path &path, std::string_view text);

		// Absolute paths of all source files referenced by spans.
		const std::set<std::filesystem::path> &get_source_files() const {
			return source_files;
		}

	private:
		CrateNode parse_crate(const nlohmann::json &j);
		ItemNode parse_item(const nlohmann::json &j);
		ImplItemNode parse_impl_item(const nlohmann::json &j);
		SyntaxNode parse_syntax(const nlohmann::json &j);
		UseTree parse_use_tree(const nlohmann::json &j);
		std::vector<SyntaxNode> parse_syntax_list(const nlohmann::json &j);
		slang::SourceRange parse_span(const nlohmann::json &j);
		slang::BufferID get_buffer(const std::string &file);

		slang::SourceManager &source_manager;
		std::filesystem::path base_dir;
		std::unordered_map<std::string, slang::BufferID> buffers;
		std::set<std::filesystem::path> source_files;
	};

	// The text a range covers, empty for ranges without a buffer.
	std::string_view source_text(
		const slang::SourceManager &source_manager, slang::SourceRange range
	);
} // namespace rsfuse
