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
#include "errors.hh"
#include "graph.hh"

#include <slang/text/SourceLocation.h>

#include <string_view>
#include <vector>

namespace rsfuse {
	enum class ResolutionState {
		undecided = 0,
		required,
		excluded,
		pending,
	};

	std::string_view to_string(ResolutionState state);

	// Per-run state of every catalog item, indexed by ItemId.
	class ResolutionTable {
	public:
		explicit ResolutionTable(size_t size)
			: states(size, ResolutionState::undecided) {}

		ResolutionState get(ItemId item) const { return states.at(item); }
		void set(ItemId item, ResolutionState state) { states.at(item) = state; }
		bool is_required(ItemId item) const {
			return get(item) == ResolutionState::required;
		}

		// Catalog order.
		std::vector<ItemId> in_state(ResolutionState state) const;
		size_t count(ResolutionState state) const;
		size_t size() const { return states.size(); }

	private:
		std::vector<ResolutionState> states;
	};

	struct UsageSite {
		ItemId item = no_item;
		slang::SourceRange span;
	};

	/**
	 * @brief Computes the closure of required items over the dependency
	 * graph.
	 *
	 * Plain edges are followed; every item is expanded at most once, so
	 * cycles terminate. Ambiguous edges are not followed: their candidates
	 * become pending once the source is required and the candidate's block
	 * is relevant (see is_relevant()).
	 *
	 * Requiring any item of a trait impl block requires all of its items.
	 */
	class ReachabilityAnalyzer {
	public:
		ReachabilityAnalyzer(
			const Catalog &catalog,
			const DependencyGraph &graph,
			ResolutionTable &table,
			Diagnostics *diagnostics = nullptr
		)
			: catalog(catalog), graph(graph), table(table),
			  diagnostics(diagnostics), relevant(catalog.size(), false) {}

		/**
		 * @brief Marks the item required and propagates to everything it
		 * reaches, overriding an earlier exclusion.
		 */
		void require(ItemId item);
		void require_all(const std::vector<ItemId> &items);

		/**
		 * @brief Undecided candidates of ambiguous edges whose source is
		 * required become pending. Returns the number of new pending items.
		 */
		size_t refresh_pending();

		// Makes a block relevant regardless of its target type.
		void mark_relevant(ItemId block);
		void mark_block_pending(ItemId block);

		/**
		 * @brief A block is relevant if it is required, its target type is
		 * required, it was marked relevant, or it implements a required
		 * trait for a type outside the fused crates.
		 */
		bool is_relevant(ItemId block) const;

		// Required items referring to the impl item through an ambiguous edge.
		std::vector<UsageSite> usage_sites(ItemId impl_item) const;

		size_t get_edges_visited() const { return edges_visited; }

	private:
		void propagate();
		void require_siblings(ItemId block);

		const Catalog &catalog;
		const DependencyGraph &graph;
		ResolutionTable &table;
		Diagnostics *diagnostics;
		std::vector<bool> relevant;
		std::vector<ItemId> worklist;
		size_t edges_visited = 0;
	};
} // namespace rsfuse
