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

#include <slang/text/SourceLocation.h>

#include <tsl/ordered_set.h>

#include <cstdio>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rsfuse {
	/**
	 * @brief A reference whose plain name matches impl items of more than one
	 * impl block.
	 *
	 * The edge is never followed automatically; which candidates are meant
	 * is decided by the conflict policy engine.
	 */
	struct AmbiguousEdge {
		ItemId source = no_item;
		std::string name;
		std::vector<ItemId> candidates; // impl items, catalog order
		slang::SourceRange span;
	};

	class DependencyGraph {
	public:
		const tsl::ordered_set<ItemId> &get_edges(ItemId item) const {
			return edges.at(item);
		}
		const std::vector<size_t> &get_ambiguous_edge_ids(ItemId item) const {
			return ambiguous_by_source.at(item);
		}
		const AmbiguousEdge &get_ambiguous_edge(size_t id) const {
			return ambiguous.at(id);
		}
		const std::vector<AmbiguousEdge> &get_ambiguous_edges() const {
			return ambiguous;
		}

		// Implementation links: impl blocks targeting a type, or
		// implementing a trait.
		const std::vector<ItemId> &get_impl_blocks(ItemId type) const {
			return impl_blocks.at(type);
		}
		ItemId get_target_type(ItemId block) const {
			return target_types.at(block);
		}
		ItemId get_trait(ItemId block) const { return traits.at(block); }

		// Per tree of a use item, what it imports. Empty for imports from
		// outside the fused crates.
		const std::vector<std::vector<ItemId>> &get_use_targets(ItemId use
		) const {
			return use_targets.at(use);
		}

		size_t size() const { return edges.size(); }
		size_t edge_count() const;

		void output(const Catalog &catalog, FILE *f = stderr) const;

	private:
		friend class GraphBuilder;

		std::vector<tsl::ordered_set<ItemId>> edges;
		std::vector<std::vector<size_t>> ambiguous_by_source;
		std::vector<AmbiguousEdge> ambiguous;
		std::vector<std::vector<ItemId>> impl_blocks;
		std::vector<ItemId> target_types;
		std::vector<ItemId> traits;
		std::vector<std::vector<std::vector<ItemId>>> use_targets;
	};

	/**
	 * @brief Resolves the references of every catalog item into edges.
	 *
	 * Paths are resolved in scope: `crate`, `self`, `super`, fused crate
	 * names, children of the current module, then names introduced by `use`
	 * items. A single-segment path matching none of those falls back to every
	 * catalog item of that name. Leading segments naming nothing (`std`) are
	 * external and produce no edge.
	 */
	class GraphBuilder {
	public:
		explicit GraphBuilder(const Catalog &catalog) : catalog(catalog) {}

		DependencyGraph build();

	private:
		using LookupGuard = std::set<std::pair<ItemId, std::string>>;

		struct LookupResult {
			std::vector<ItemId> items;
			bool external = false; // imported from outside the fused crates
		};

		struct PathTarget {
			std::vector<ItemId> items;
			bool external = false;
			// `Type::name`: the remaining segment is associated with a type
			ItemId assoc_type = no_item;
			std::string assoc_name;
		};

		void link_impl_blocks();
		void add_structure(ItemId item);
		void add_use(ItemId item);
		void add_reference(ItemId item, const Reference &reference);
		void add_path(ItemId item, const Reference &reference);
		void add_associated(
			ItemId item,
			ItemId type,
			ItemId block,
			const std::string &name,
			slang::SourceRange span
		);
		void add_candidates(
			ItemId item,
			const std::string &name,
			std::vector<ItemId> candidates,
			slang::SourceRange span
		);
		void add_edge(ItemId from, ItemId to);

		LookupResult lookup(
			ItemId module,
			const std::string &name,
			std::vector<ItemId> &via,
			LookupGuard &guard
		) const;
		PathTarget resolve_segments(
			ItemId scope,
			const std::vector<std::string> &segments,
			std::vector<ItemId> &via,
			LookupGuard &guard
		) const;

		ItemId module_of(ItemId item) const;
		ItemId parent_module(ItemId module) const;
		ItemId enclosing_block(ItemId item) const;

		const Catalog &catalog;
		DependencyGraph graph;
	};
} // namespace rsfuse
