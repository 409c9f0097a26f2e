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

#include "policy.hh"
#include "impl_name.hh"

#include <fmt/format.h>

#include <tsl/ordered_map.h>

#include <algorithm>

using namespace rsfuse;

static void add_unique(std::vector<std::string> &list, std::string entry) {
	if (std::find(list.begin(), list.end(), entry) == list.end()) {
		list.push_back(std::move(entry));
	}
}

std::vector<ItemDecision> rsfuse::BatchResolutionProvider::resolve(
	const std::vector<PendingBlock> &blocks
) {
	std::string listing;
	size_t count = 0;
	for (auto &block : blocks) {
		listing += fmt::format("\n  {}", catalog.get(block.block).name);
		for (auto &pending : block.items) {
			listing += fmt::format(
				"\n    {}", catalog.impl_item_pattern(pending.item)
			);
			count++;
		}
	}
	throw FusionError(
		ErrorKind::ambiguous_impl_item_reference,
		fmt::format(
			"{} impl item(s) are referenced ambiguously and have no "
			"configuration entry:{}",
			count,
			listing
		)
	);
}

rsfuse::ConflictPolicyEngine::ConflictPolicyEngine(
	const Catalog &catalog,
	const Configuration &config,
	PolicyOptions options,
	Diagnostics &diagnostics
)
	: catalog(catalog), options(options),
	  diagnostics(diagnostics) {
	match_item_patterns(
		config.impl_items.include, included_items, "impl_items.include"
	);
	match_item_patterns(
		config.impl_items.exclude, excluded_items, "impl_items.exclude"
	);
	match_block_names(
		config.impl_blocks.include, included_blocks, "impl_blocks.include"
	);
	match_block_names(
		config.impl_blocks.exclude, excluded_blocks, "impl_blocks.exclude"
	);
}

void rsfuse::ConflictPolicyEngine::unknown_target(
	const std::string &entry, const char *list
) {
	diagnostics.add(
		Severity::warning,
		DiagnosticKind::unknown_config_target,
		fmt::format("'{}' in {} matches nothing.", entry, list)
	);
}

void rsfuse::ConflictPolicyEngine::match_item_patterns(
	const std::vector<std::string> &patterns,
	tsl::ordered_set<ItemId> &target,
	const char *list
) {
	for (auto &entry : patterns) {
		auto pattern = ImplItemPattern::parse(entry);
		if (pattern.block.has_value()) {
			bool matched = false;
			for (auto block : catalog.impl_blocks_named(*pattern.block)) {
				for (auto child : catalog.get(block).children) {
					if (pattern.is_wildcard() ||
						catalog.get(child).name == pattern.item_name) {
						target.insert(child);
						matched = true;
					}
				}
			}
			if (!matched) {
				unknown_target(entry, list);
			}
			continue;
		}

		auto &candidates = catalog.impl_items_named(pattern.item_name);
		auto blocks = catalog.owning_blocks(candidates);
		if (blocks.empty()) {
			unknown_target(entry, list);
			continue;
		}
		if (blocks.size() > 1) {
			std::string listing;
			for (auto block : blocks) {
				listing += fmt::format(
					"\n  {}@{}", pattern.item_name, catalog.get(block).name
				);
			}
			throw FusionError(
				ErrorKind::ambiguous_impl_item_reference,
				fmt::format(
					"'{}' in {} names impl items of {} impl blocks; qualify it "
					"as one of:{}",
					entry,
					list,
					blocks.size(),
					listing
				)
			);
		}
		for (auto candidate : candidates) {
			target.insert(candidate);
		}
	}
}

void rsfuse::ConflictPolicyEngine::match_block_names(
	const std::vector<std::string> &names,
	tsl::ordered_set<ItemId> &target,
	const char *list
) {
	for (auto &entry : names) {
		auto blocks = catalog.impl_blocks_named(ImplBlockName::parse(entry));
		if (blocks.empty()) {
			unknown_target(entry, list);
		}
		for (auto block : blocks) {
			target.insert(block);
		}
	}
}

std::vector<ItemId> rsfuse::ConflictPolicyEngine::get_forced_includes() const {
	std::vector<ItemId> forced(included_items.begin(), included_items.end());
	for (auto block : included_blocks) {
		auto &block_item = catalog.get(block);
		if (!block_item.has_trait()) {
			continue;
		}
		forced.push_back(block);
		for (auto child : block_item.children) {
			forced.push_back(child);
		}
	}
	return forced;
}

Decision rsfuse::ConflictPolicyEngine::decide(ItemId impl_item) const {
	auto block = catalog.get(impl_item).parent;
	bool trait = catalog.get(block).has_trait();
	if (included_items.count(impl_item) ||
		(trait && included_blocks.count(block))) {
		return Decision::include;
	}
	if (options.impl_items_default == Decision::include) {
		return Decision::include;
	}
	if (excluded_items.count(impl_item)) {
		return Decision::exclude;
	}
	// a block include wins over a block exclude, also for trait-free blocks
	if (excluded_blocks.count(block) && !included_blocks.count(block)) {
		return Decision::exclude;
	}
	return options.impl_items_default;
}

void rsfuse::ConflictPolicyEngine::resolve(
	ResolutionTable &table,
	ReachabilityAnalyzer &analyzer,
	ResolutionProvider &provider
) {
	for (auto block : included_blocks) {
		if (!catalog.get(block).has_trait()) {
			analyzer.mark_block_pending(block);
		}
	}

	while (true) {
		analyzer.refresh_pending();
		auto pending = table.in_state(ResolutionState::pending);
		if (pending.empty()) {
			break;
		}

		bool changed = false;
		tsl::ordered_map<ItemId, std::vector<ItemId>> open;
		for (auto id : pending) {
			if (table.get(id) != ResolutionState::pending) {
				continue; // settled by an earlier inclusion
			}
			auto &item = catalog.get(id);
			auto &block = catalog.get(item.parent);
			switch (decide(id)) {
			case Decision::include:
				if (options.verbose) {
					fmt::println(
						stderr, "Setting include option for '{}'", item.identity
					);
				}
				analyzer.require(id);
				changed = true;
				break;
			case Decision::exclude:
				if (options.verbose) {
					fmt::println(
						stderr, "Setting exclude option for '{}'", item.identity
					);
				}
				table.set(id, ResolutionState::excluded);
				changed = true;
				break;
			case Decision::none:
				if (!block.has_trait()) {
					open[item.parent].push_back(id);
					break;
				}
				if (!warned_blocks.count(item.parent)) {
					warned_blocks.insert(item.parent);
					diagnostics.add(
						Severity::warning,
						DiagnosticKind::unresolved_trait_impl,
						fmt::format(
							"Trait impl '{}' may be used implicitly; it is not "
							"fused unless listed in impl_blocks.include.",
							block.name
						),
						block.span.start()
					);
				}
				table.set(id, ResolutionState::excluded);
				changed = true;
				break;
			}
		}
		if (changed) {
			continue;
		}

		std::vector<PendingBlock> blocks;
		for (auto &[block, items] : open) {
			PendingBlock pending_block{block, {}};
			for (auto id : items) {
				pending_block.items.push_back({id, analyzer.usage_sites(id)});
			}
			blocks.push_back(std::move(pending_block));
		}

		size_t applied = 0;
		for (auto &answer : provider.resolve(blocks)) {
			if (table.get(answer.item) != ResolutionState::pending) {
				continue;
			}
			record(answer);
			if (answer.decision == Decision::include) {
				analyzer.require(answer.item);
				applied++;
			} else if (answer.decision == Decision::exclude) {
				table.set(answer.item, ResolutionState::excluded);
				applied++;
			}
		}
		if (applied == 0) {
			throw FusionError(
				ErrorKind::operator_cancelled,
				"Resolution ended without a decision for the pending impl "
				"items."
			);
		}
	}

	finalize(table, analyzer);
}

void rsfuse::ConflictPolicyEngine::record(const ItemDecision &decision) {
	auto &item = catalog.get(decision.item);
	auto &list = decision.decision == Decision::include
					 ? decisions.impl_items.include
					 : decisions.impl_items.exclude;
	if (decision.block_wide) {
		add_unique(list, fmt::format("*@{}", catalog.get(item.parent).name));
	} else {
		add_unique(list, catalog.impl_item_pattern(decision.item));
	}
}

void rsfuse::ConflictPolicyEngine::finalize(
	ResolutionTable &table, const ReachabilityAnalyzer &analyzer
) {
	for (auto &item : catalog.get_items()) {
		if (!item.is_impl_block() || !item.has_trait() ||
			table.is_required(item.id) || item.children.empty() ||
			warned_blocks.count(item.id) || excluded_blocks.count(item.id)) {
			continue;
		}
		if (!analyzer.is_relevant(item.id)) {
			continue;
		}
		if (options.verbose) {
			fmt::println(stderr, "Excluding trait impl '{}'", item.name);
		}
		diagnostics.add(
			Severity::note,
			DiagnosticKind::excluded_trait_impl,
			fmt::format(
				"Trait impl '{}' of a fused type is not referenced and not "
				"fused.",
				item.name
			),
			item.span.start()
		);
	}

	for (ItemId id = 0; id < table.size(); id++) {
		if (!table.is_required(id)) {
			table.set(id, ResolutionState::excluded);
		}
	}
}
