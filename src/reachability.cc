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

#include "reachability.hh"

#include <fmt/format.h>

#include <algorithm>

using namespace rsfuse;

std::string_view rsfuse::to_string(ResolutionState state) {
	switch (state) {
	case ResolutionState::undecided:
		return "Undecided";
	case ResolutionState::required:
		return "Required";
	case ResolutionState::excluded:
		return "Excluded";
	case ResolutionState::pending:
		return "Pending";
	}
	return "Unknown";
}

std::vector<ItemId> rsfuse::ResolutionTable::in_state(ResolutionState state
) const {
	std::vector<ItemId> result;
	for (ItemId id = 0; id < states.size(); id++) {
		if (states[id] == state) {
			result.push_back(id);
		}
	}
	return result;
}

size_t rsfuse::ResolutionTable::count(ResolutionState state) const {
	return std::count(states.begin(), states.end(), state);
}

void rsfuse::ReachabilityAnalyzer::require(ItemId item) {
	if (table.is_required(item)) {
		return;
	}
	table.set(item, ResolutionState::required);
	worklist.push_back(item);
	propagate();
}

void rsfuse::ReachabilityAnalyzer::require_all(const std::vector<ItemId> &items
) {
	for (auto item : items) {
		if (!table.is_required(item)) {
			table.set(item, ResolutionState::required);
			worklist.push_back(item);
		}
	}
	propagate();
}

void rsfuse::ReachabilityAnalyzer::propagate() {
	while (!worklist.empty()) {
		auto current = worklist.back();
		worklist.pop_back();

		auto &item = catalog.get(current);
		if (item.is_impl_block() && item.has_trait()) {
			require_siblings(current);
		}
		for (auto target : graph.get_edges(current)) {
			edges_visited++;
			if (!table.is_required(target)) {
				table.set(target, ResolutionState::required);
				worklist.push_back(target);
			}
		}
	}
}

void rsfuse::ReachabilityAnalyzer::require_siblings(ItemId block) {
	auto &block_item = catalog.get(block);
	bool forced = false;
	for (auto child : block_item.children) {
		if (!table.is_required(child)) {
			table.set(child, ResolutionState::required);
			worklist.push_back(child);
			forced = true;
		}
	}
	if (forced && diagnostics) {
		diagnostics->add(
			Severity::note,
			DiagnosticKind::forced_inclusion,
			fmt::format(
				"Including all items of trait impl '{}'.", block_item.name
			),
			block_item.span.start()
		);
	}
}

size_t rsfuse::ReachabilityAnalyzer::refresh_pending() {
	size_t added = 0;
	for (auto &edge : graph.get_ambiguous_edges()) {
		if (!table.is_required(edge.source)) {
			continue;
		}
		for (auto candidate : edge.candidates) {
			if (table.get(candidate) != ResolutionState::undecided) {
				continue;
			}
			if (is_relevant(catalog.get(candidate).parent)) {
				table.set(candidate, ResolutionState::pending);
				added++;
			}
		}
	}
	return added;
}

void rsfuse::ReachabilityAnalyzer::mark_relevant(ItemId block) {
	relevant.at(block) = true;
}

void rsfuse::ReachabilityAnalyzer::mark_block_pending(ItemId block) {
	mark_relevant(block);
	for (auto child : catalog.get(block).children) {
		if (table.get(child) == ResolutionState::undecided) {
			table.set(child, ResolutionState::pending);
		}
	}
}

bool rsfuse::ReachabilityAnalyzer::is_relevant(ItemId block) const {
	if (relevant.at(block) || table.is_required(block)) {
		return true;
	}
	auto type = graph.get_target_type(block);
	if (type != no_item) {
		return table.is_required(type);
	}
	auto trait = graph.get_trait(block);
	return trait != no_item && table.is_required(trait);
}

std::vector<UsageSite> rsfuse::ReachabilityAnalyzer::usage_sites(
	ItemId impl_item
) const {
	std::vector<UsageSite> sites;
	for (auto &edge : graph.get_ambiguous_edges()) {
		if (!table.is_required(edge.source)) {
			continue;
		}
		if (std::find(
				edge.candidates.begin(), edge.candidates.end(), impl_item
			) != edge.candidates.end()) {
			sites.push_back({edge.source, edge.span});
		}
	}
	return sites;
}
