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

#include "fixtures.hh"
#include "graph.hh"
#include "reachability.hh"

#include <gtest/gtest.h>

using namespace rsfuse;
using namespace rsfuse::testing;

namespace {
	struct Analysis {
		explicit Analysis(const Program &program)
			: graph(GraphBuilder(program.catalog).build()),
			  table(program.catalog.size()),
			  analyzer(program.catalog, graph, table, &diagnostics) {}

		Diagnostics diagnostics;
		DependencyGraph graph;
		ResolutionTable table;
		ReachabilityAnalyzer analyzer;
	};
} // namespace

TEST(ReachabilityAnalyzer, CyclesTerminate) {
	std::vector<CrateNode> crates;
	crates.push_back(binary(
		"app",
		{fn("main", {path({"a"})}),
		 fn("a", {path({"b"})}),
		 fn("b", {path({"c"})}),
		 fn("c", {path({"a"}), path({"main"})}),
		 fn("unused", {path({"a"})})}
	));
	Program program(std::move(crates));
	Analysis analysis(program);
	analysis.analyzer.require(program.id("app[bin]::main (Fn)"));

	for (auto name : {"main", "a", "b", "c"}) {
		auto identity = std::string{"app[bin]::"} + name + " (Fn)";
		EXPECT_TRUE(analysis.table.is_required(program.id(identity))) << name;
	}
	EXPECT_TRUE(analysis.table.is_required(program.id("app[bin] (Crate)")));
	EXPECT_EQ(
		analysis.table.get(program.id("app[bin]::unused (Fn)")),
		ResolutionState::undecided
	);
	EXPECT_EQ(analysis.table.count(ResolutionState::required), 5u);
}

TEST(ReachabilityAnalyzer, RequireOverridesExclusion) {
	std::vector<CrateNode> crates;
	crates.push_back(binary("app", {fn("main", {path({"helper"})}), fn("helper")}));
	Program program(std::move(crates));
	Analysis analysis(program);
	auto helper = program.id("app[bin]::helper (Fn)");
	analysis.table.set(helper, ResolutionState::excluded);
	analysis.analyzer.require_all({program.id("app[bin]::main (Fn)")});
	EXPECT_TRUE(analysis.table.is_required(helper));
}

TEST(ReachabilityAnalyzer, TraitBlocksAreRequiredAtomically) {
	std::vector<CrateNode> crates;
	crates.push_back(binary(
		"app",
		{item(ItemKind::struct_item, "Point"),
		 impl("", "Clone", "Point", {impl_fn("clone"), impl_fn("clone_from")}),
		 fn("main", {path({"Point", "clone"})})}
	));
	Program program(std::move(crates));
	Analysis analysis(program);
	analysis.analyzer.require(program.id("app[bin]::main (Fn)"));

	EXPECT_TRUE(analysis.table.is_required(
		program.id("app[bin]::{impl Clone for Point}::clone (Impl Fn)")
	));
	EXPECT_TRUE(analysis.table.is_required(
		program.id("app[bin]::{impl Clone for Point}::clone_from (Impl Fn)")
	));
	EXPECT_EQ(analysis.diagnostics.count(DiagnosticKind::forced_inclusion), 1u);
}

TEST(ReachabilityAnalyzer, InherentBlocksAreNotAtomic) {
	Program program(game_crates());
	Analysis analysis(program);
	analysis.analyzer.require(program.id("game[bin]::main (Fn)"));

	auto block = std::string{"my_map_two_dim::{"} + map_block + "}";
	EXPECT_TRUE(analysis.table.is_required(program.id(block + "::new (Impl Fn)")));
	EXPECT_EQ(
		analysis.table.get(program.id(block + "::get (Impl Fn)")),
		ResolutionState::undecided
	);
}

TEST(ReachabilityAnalyzer, PendingCandidatesOfRelevantBlocks) {
	Program program(game_crates());
	Analysis analysis(program);
	analysis.analyzer.require(program.id("game[bin]::main (Fn)"));
	EXPECT_EQ(analysis.analyzer.refresh_pending(), 3u);

	auto map_set =
		program.id(std::string{"my_map_two_dim::{"} + map_block + "}::set (Impl Fn)");
	auto other_set = program.id("game[bin]::{impl Other}::set (Impl Fn)");
	EXPECT_EQ(analysis.table.get(map_set), ResolutionState::pending);
	EXPECT_EQ(
		analysis.table.get(
			program.id("game[bin]::{impl fmt::Display for Go}::fmt (Impl Fn)")
		),
		ResolutionState::pending
	);
	EXPECT_EQ(
		analysis.table.get(
			program.id("game[bin]::{impl Display for Value}::fmt (Impl Fn)")
		),
		ResolutionState::pending
	);
	// Other is never used, so its set cannot be meant
	EXPECT_EQ(analysis.table.get(other_set), ResolutionState::undecided);
	EXPECT_FALSE(analysis.analyzer.is_relevant(
		program.id("game[bin]::{impl Other} (Impl)")
	));

	// nothing new on a second pass
	EXPECT_EQ(analysis.analyzer.refresh_pending(), 0u);

	auto sites = analysis.analyzer.usage_sites(map_set);
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_EQ(sites[0].item, program.id("game[bin]::{impl Go}::apply (Impl Fn)"));
}

TEST(ReachabilityAnalyzer, MarkBlockPending) {
	Program program(game_crates());
	Analysis analysis(program);
	auto block = program.id("game[bin]::{impl Other} (Impl)");
	analysis.analyzer.mark_block_pending(block);
	EXPECT_TRUE(analysis.analyzer.is_relevant(block));
	EXPECT_EQ(
		analysis.table.get(program.id("game[bin]::{impl Other}::set (Impl Fn)")),
		ResolutionState::pending
	);
	EXPECT_EQ(analysis.table.get(block), ResolutionState::undecided);
}

TEST(ResolutionTable, States) {
	ResolutionTable table(4);
	table.set(1, ResolutionState::required);
	table.set(3, ResolutionState::required);
	table.set(2, ResolutionState::pending);
	EXPECT_EQ(table.in_state(ResolutionState::required), (std::vector<ItemId>{1, 3}));
	EXPECT_EQ(table.count(ResolutionState::undecided), 1u);
	EXPECT_EQ(to_string(ResolutionState::pending), "Pending");
}
