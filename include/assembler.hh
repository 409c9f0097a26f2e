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

#include "catalog.hh"
#include "graph.hh"
#include "reachability.hh"

#include <slang/text/SourceManager.h>

#include <tsl/ordered_set.h>

#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	// Required items in catalog order; each identity at most once.
	struct FusionResult {
		tsl::ordered_set<ItemId> items;

		bool contains(ItemId item) const { return items.count(item) != 0; }
		size_t size() const { return items.size(); }
	};

	/**
	 * @brief Collects the required items of a completed resolution pass.
	 *
	 * @exception std::logic_error if an item is still pending or undecided.
	 */
	FusionResult
	assemble(const Catalog &catalog, const ResolutionTable &table);

	/**
	 * @brief Renders a fusion result as one source text.
	 *
	 * Items of the binary crate root are emitted at top level, every library
	 * crate is wrapped in `pub mod <crate>`, and modules are recreated inline.
	 * Paths are rewritten so that they still resolve inside the wrapping
	 * module: `crate::x` in a library becomes `crate::<crate>::x`, and a path
	 * starting with a fused crate name gets a `crate::` prefix outside the
	 * root scope.
	 */
	class Emitter {
	public:
		Emitter(
			const Catalog &catalog,
			const DependencyGraph &graph,
			const slang::SourceManager &source_manager
		)
			: catalog(catalog), graph(graph), source_manager(source_manager) {}

		std::string emit(const FusionResult &result) const;

	private:
		struct Edit {
			size_t offset;
			std::string insertion;
		};

		void emit_children(
			ItemId parent,
			const FusionResult &result,
			std::string &out,
			size_t depth
		) const;
		void emit_item(
			ItemId item,
			const FusionResult &result,
			std::string &out,
			size_t depth
		) const;
		void emit_use(
			ItemId item,
			const FusionResult &result,
			std::string &out,
			size_t depth
		) const;

		std::string
		path_prefix_fix(const Item &item, const std::string &first) const;
		void collect_edits(
			const Item &item,
			const std::vector<SyntaxNode> &syntax,
			slang::SourceRange range,
			std::vector<Edit> &edits
		) const;
		std::string rewrite(
			const Item &item,
			const std::vector<SyntaxNode> &syntax,
			slang::SourceRange range
		) const;

		const Catalog &catalog;
		const DependencyGraph &graph;
		const slang::SourceManager &source_manager;
	};
} // namespace rsfuse
