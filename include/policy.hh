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
#include "config.hh"
#include "errors.hh"
#include "reachability.hh"

#include <tsl/ordered_set.h>

#include <optional>
#include <vector>

namespace rsfuse {
	enum class Decision {
		none = 0,
		include,
		exclude,
	};

	struct PendingItem {
		ItemId item = no_item;
		std::vector<UsageSite> usages;
	};

	// A trait-free impl block with items awaiting a decision.
	struct PendingBlock {
		ItemId block = no_item;
		std::vector<PendingItem> items;
	};

	struct ItemDecision {
		ItemId item = no_item;
		Decision decision = Decision::none;
		bool block_wide = false; // taken for all pending items of the block
	};

	/**
	 * @brief Source of decisions for pending items that neither the
	 * configuration nor a default could settle.
	 */
	class ResolutionProvider {
	public:
		virtual ~ResolutionProvider() = default;

		/**
		 * @brief Returns at least one decision for an item of `blocks`.
		 *
		 * Decisions may depend on earlier ones: the engine re-runs closure
		 * after applying them and asks again with what is still pending.
		 */
		virtual std::vector<ItemDecision>
		resolve(const std::vector<PendingBlock> &blocks) = 0;
	};

	// Non-interactive runs: anything pending is fatal.
	class BatchResolutionProvider : public ResolutionProvider {
	public:
		explicit BatchResolutionProvider(const Catalog &catalog)
			: catalog(catalog) {}

		/**
		 * @exception rsfuse::FusionError (AmbiguousImplItemReference), always.
		 */
		std::vector<ItemDecision>
		resolve(const std::vector<PendingBlock> &blocks) override;

	private:
		const Catalog &catalog;
	};

	struct PolicyOptions {
		bool verbose = false;
		// --process-all-impl-items
		Decision impl_items_default = Decision::none;
	};

	/**
	 * @brief Settles every impl item left pending by the reachability
	 * analysis.
	 *
	 * Precedence per item: explicit include > global include > explicit
	 * exclude > global exclude. Unsettled items of trait impls are excluded
	 * with an UnresolvedTraitImpl warning; unsettled items of trait-free
	 * impls are handed to the resolution provider.
	 */
	class ConflictPolicyEngine {
	public:
		/**
		 * @brief Matches the configuration against the catalog.
		 *
		 * @exception rsfuse::FusionError (InvalidConfigPattern) for a
		 * malformed pattern.
		 * @exception rsfuse::FusionError (AmbiguousImplItemReference) for an
		 * unqualified item pattern naming items of several blocks.
		 */
		ConflictPolicyEngine(
			const Catalog &catalog,
			const Configuration &config,
			PolicyOptions options,
			Diagnostics &diagnostics
		);

		/**
		 * @brief Items that must be fused because the configuration
		 * includes them: included impl items and all items of included
		 * trait impls.
		 */
		std::vector<ItemId> get_forced_includes() const;

		/**
		 * @brief Runs the resolution pass until every item is required or
		 * excluded.
		 *
		 * Reachability must already have been run from the entry points
		 * and forced includes.
		 *
		 * @exception rsfuse::FusionError whatever the provider throws.
		 */
		void resolve(
			ResolutionTable &table,
			ReachabilityAnalyzer &analyzer,
			ResolutionProvider &provider
		);

		// Decisions taken by the provider, as configuration entries.
		const Configuration &get_decisions() const { return decisions; }

		Decision decide(ItemId impl_item) const;

	private:
		void match_item_patterns(
			const std::vector<std::string> &patterns,
			tsl::ordered_set<ItemId> &target,
			const char *list
		);
		void match_block_names(
			const std::vector<std::string> &names,
			tsl::ordered_set<ItemId> &target,
			const char *list
		);
		void unknown_target(const std::string &entry, const char *list);
		void record(const ItemDecision &decision);
		void finalize(ResolutionTable &table, const ReachabilityAnalyzer &analyzer);

		const Catalog &catalog;
		PolicyOptions options;
		Diagnostics &diagnostics;

		tsl::ordered_set<ItemId> included_items;
		tsl::ordered_set<ItemId> excluded_items;
		tsl::ordered_set<ItemId> included_blocks;
		tsl::ordered_set<ItemId> excluded_blocks;
		tsl::ordered_set<ItemId> warned_blocks;

		Configuration decisions;
	};
} // namespace rsfuse
