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

#include "errors.hh"
#include "fixtures.hh"
#include "fusion.hh"
#include "policy.hh"

#include <fmt/format.h>

#include <gtest/gtest.h>

using namespace rsfuse;
using namespace rsfuse::testing;

namespace {
	std::string map_item(std::string_view name) {
		return fmt::format("my_map_two_dim::{{{}}}::{} (Impl Fn)", map_block, name);
	}

	std::string map_pattern(std::string_view name) {
		return fmt::format("{}@{}", name, map_block);
	}

	const char *const go_fmt = "game[bin]::{impl fmt::Display for Go}::fmt (Impl Fn)";
	const char *const value_fmt =
		"game[bin]::{impl Display for Value}::fmt (Impl Fn)";
	const char *const other_set = "game[bin]::{impl Other}::set (Impl Fn)";

	FusionError expect_error(
		const Program &program,
		const Configuration &config,
		PolicyOptions options = {}
	) {
		Diagnostics diagnostics;
		try {
			Fusion fusion(program.catalog, config, {"main", options}, diagnostics);
			BatchResolutionProvider provider(program.catalog);
			fusion.run(provider);
		} catch (FusionError &e) {
			return e;
		}
		ADD_FAILURE() << "fusion succeeded";
		return FusionError(ErrorKind::input_error, "");
	}
} // namespace

TEST(ConflictPolicy, DisplayImplsSelectedByBlock) {
	Program program(game_crates());
	Configuration config;
	config.impl_blocks.include = {"impl Display for Value"};
	config.impl_blocks.exclude = {"impl fmt::Display for Go"};
	config.impl_items.include = {map_pattern("set")};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);

	auto &table = fusion.get_table();
	EXPECT_EQ(table.get(program.id(value_fmt)), ResolutionState::required);
	EXPECT_EQ(table.get(program.id(go_fmt)), ResolutionState::excluded);
	EXPECT_EQ(diagnostics.count(Severity::error), 0u);
	EXPECT_EQ(diagnostics.count(DiagnosticKind::unresolved_trait_impl), 0u);
	EXPECT_EQ(table.count(ResolutionState::pending), 0u);
	EXPECT_EQ(table.count(ResolutionState::undecided), 0u);
}

TEST(ConflictPolicy, QualifiedItemIncludeForcesGenericBlockItem) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {
		"set@impl<T:Copy+Clone+Default,constX:usize,constY:usize,constN:usize> "
		"MyMap2D<T,X,Y,N>"
	};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);

	auto &table = fusion.get_table();
	EXPECT_EQ(table.get(program.id(map_item("set"))), ResolutionState::required);
	EXPECT_EQ(table.get(program.id(other_set)), ResolutionState::excluded);
	EXPECT_EQ(table.get(program.id(map_item("get"))), ResolutionState::excluded);
	// both Display impls are left to the operator
	EXPECT_EQ(diagnostics.count(DiagnosticKind::unresolved_trait_impl), 2u);
	EXPECT_EQ(table.get(program.id(go_fmt)), ResolutionState::excluded);
	EXPECT_EQ(table.get(program.id(value_fmt)), ResolutionState::excluded);
}

TEST(ConflictPolicy, MainAndHelperOnly) {
	std::vector<CrateNode> crates;
	crates.push_back(binary(
		"app", {fn("main", {path({"helper"})}), fn("helper"), fn("unused")}
	));
	Program program(std::move(crates));

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, {}, {}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);

	std::vector<std::string> fused;
	for (auto id : fusion.get_result().items) {
		if (program.catalog.get(id).kind != ItemKind::crate_root) {
			fused.push_back(program.catalog.get(id).identity);
		}
	}
	EXPECT_EQ(
		fused,
		(std::vector<std::string>{"app[bin]::main (Fn)", "app[bin]::helper (Fn)"})
	);
	EXPECT_TRUE(diagnostics.empty());
}

TEST(ConflictPolicy, BatchFailsOnUnsettledAmbiguity) {
	Program program(game_crates());
	auto error = expect_error(program, {});
	EXPECT_EQ(error.get_kind(), ErrorKind::ambiguous_impl_item_reference);
	EXPECT_NE(std::string{error.what()}.find(map_pattern("set")), std::string::npos);
}

TEST(ConflictPolicy, UnqualifiedPatternNamingSeveralBlocks) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {"set"};
	auto error = expect_error(program, config);
	EXPECT_EQ(error.get_kind(), ErrorKind::ambiguous_impl_item_reference);
	EXPECT_NE(std::string{error.what()}.find("set@impl Other"), std::string::npos);
}

TEST(ConflictPolicy, InvalidPattern) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.exclude = {"*"};
	EXPECT_EQ(
		expect_error(program, config).get_kind(), ErrorKind::invalid_config_pattern
	);

	config = {};
	config.impl_blocks.include = {"Display for Value"};
	EXPECT_EQ(
		expect_error(program, config).get_kind(), ErrorKind::invalid_config_pattern
	);
}

TEST(ConflictPolicy, MissingEntryPoint) {
	Program program(game_crates());
	Diagnostics diagnostics;
	Fusion fusion(program.catalog, {}, {"start", {}}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	try {
		fusion.run(provider);
		FAIL() << "missing entry point accepted";
	} catch (FusionError &e) {
		EXPECT_EQ(e.get_kind(), ErrorKind::input_error);
	}
}

TEST(ConflictPolicy, IncludeBeatsExclude) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {map_pattern("set")};
	config.impl_items.exclude = {map_pattern("set")};
	config.impl_blocks.include = {"impl Display for Value"};
	config.impl_blocks.exclude = {"impl Display for Value", "impl fmt::Display for Go"};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);
	EXPECT_TRUE(fusion.get_table().is_required(program.id(map_item("set"))));
	EXPECT_TRUE(fusion.get_table().is_required(program.id(value_fmt)));
	EXPECT_FALSE(fusion.get_table().is_required(program.id(go_fmt)));
}

TEST(ConflictPolicy, GlobalIncludeBeatsExplicitExclude) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.exclude = {map_pattern("set")};

	Diagnostics diagnostics;
	Fusion fusion(
		program.catalog, config, {"main", {false, Decision::include}}, diagnostics
	);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);
	auto &table = fusion.get_table();
	EXPECT_TRUE(table.is_required(program.id(map_item("set"))));
	EXPECT_TRUE(table.is_required(program.id(go_fmt)));
	EXPECT_TRUE(table.is_required(program.id(value_fmt)));
	// the global default only applies to relevant blocks
	EXPECT_FALSE(table.is_required(program.id(other_set)));
}

TEST(ConflictPolicy, GlobalExcludeSettlesEverything) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {map_pattern("set")};

	Diagnostics diagnostics;
	Fusion fusion(
		program.catalog, config, {"main", {false, Decision::exclude}}, diagnostics
	);
	FixedResolutionProvider provider(Decision::include);
	fusion.run(provider);
	EXPECT_EQ(provider.calls, 0u);
	auto &table = fusion.get_table();
	EXPECT_TRUE(table.is_required(program.id(map_item("set"))));
	EXPECT_FALSE(table.is_required(program.id(go_fmt)));
	EXPECT_FALSE(table.is_required(program.id(value_fmt)));
	EXPECT_EQ(diagnostics.count(DiagnosticKind::unresolved_trait_impl), 0u);
}

TEST(ConflictPolicy, WildcardEqualsListingEveryItem) {
	Program program(game_crates());
	PolicyOptions options{false, Decision::exclude};

	Configuration wildcard;
	wildcard.impl_items.include = {"*@" + std::string{map_block}};
	Configuration listed;
	listed.impl_items.include = {
		map_pattern("new"), map_pattern("get"), map_pattern("set")
	};

	std::vector<ResolutionState> states[2];
	size_t run = 0;
	for (auto *config : {&wildcard, &listed}) {
		Diagnostics diagnostics;
		Fusion fusion(program.catalog, *config, {"main", options}, diagnostics);
		BatchResolutionProvider provider(program.catalog);
		fusion.run(provider);
		for (ItemId id = 0; id < program.catalog.size(); id++) {
			states[run].push_back(fusion.get_table().get(id));
		}
		run++;
	}
	EXPECT_EQ(states[0], states[1]);
	EXPECT_EQ(states[0][program.id(map_item("get"))], ResolutionState::required);
}

TEST(ConflictPolicy, ProviderDecisionsAreRecorded) {
	Program program(game_crates());
	Diagnostics diagnostics;
	Fusion fusion(program.catalog, {}, {}, diagnostics);
	FixedResolutionProvider provider(Decision::include);
	fusion.run(provider);

	EXPECT_EQ(provider.calls, 1u);
	EXPECT_EQ(provider.asked, (std::vector<ItemId>{program.id(map_item("set"))}));
	EXPECT_TRUE(fusion.get_table().is_required(program.id(map_item("set"))));
	EXPECT_EQ(
		fusion.get_decisions().impl_items.include,
		(std::vector<std::string>{map_pattern("set")})
	);
	EXPECT_TRUE(fusion.get_decisions().impl_items.exclude.empty());
	EXPECT_EQ(diagnostics.count(DiagnosticKind::unresolved_trait_impl), 2u);
}

TEST(ConflictPolicy, IncludedTraitFreeBlockGoesToProvider) {
	Program program(game_crates());
	Configuration config;
	config.impl_blocks.include = {"impl Other"};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {}, diagnostics);
	FixedResolutionProvider provider(Decision::exclude);
	fusion.run(provider);

	EXPECT_EQ(
		provider.asked,
		(std::vector<ItemId>{program.id(map_item("set")), program.id(other_set)})
	);
	EXPECT_EQ(fusion.get_table().get(program.id(other_set)), ResolutionState::excluded);
	EXPECT_EQ(
		fusion.get_decisions().impl_items.exclude,
		(std::vector<std::string>{map_pattern("set"), "set@impl Other"})
	);
}

TEST(ConflictPolicy, BlockIncludeBeatsBlockExcludeForTraitFreeBlock) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {map_pattern("set")};
	config.impl_blocks.include = {"impl Other"};
	config.impl_blocks.exclude = {"impl Other"};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {}, diagnostics);
	FixedResolutionProvider provider(Decision::include);
	fusion.run(provider);

	EXPECT_EQ(provider.asked, (std::vector<ItemId>{program.id(other_set)}));
	EXPECT_EQ(fusion.get_table().get(program.id(other_set)), ResolutionState::required);
	EXPECT_TRUE(fusion.get_table().is_required(program.id(map_item("set"))));
}

TEST(ConflictPolicy, ProviderWithoutDecisionCancels) {
	class SilentProvider : public ResolutionProvider {
	public:
		std::vector<ItemDecision> resolve(const std::vector<PendingBlock> &) override {
			return {};
		}
	};

	Program program(game_crates());
	Diagnostics diagnostics;
	Fusion fusion(program.catalog, {}, {}, diagnostics);
	SilentProvider provider;
	try {
		fusion.run(provider);
		FAIL() << "run without decisions succeeded";
	} catch (FusionError &e) {
		EXPECT_EQ(e.get_kind(), ErrorKind::operator_cancelled);
	}
}

TEST(ConflictPolicy, UnknownTargetsWarn) {
	Program program(game_crates());
	Configuration config;
	config.impl_items.include = {map_pattern("set")};
	config.impl_items.exclude = {"vanished"};
	config.impl_blocks.exclude = {"impl Missing"};

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, config, {"main", {false, Decision::exclude}}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);
	EXPECT_EQ(diagnostics.count(DiagnosticKind::unknown_config_target), 2u);
	EXPECT_EQ(diagnostics.count(Severity::warning), 2u);
}

TEST(ConflictPolicy, UnreferencedTraitImplOfFusedType) {
	std::vector<CrateNode> crates;
	crates.push_back(binary(
		"app",
		{item(ItemKind::struct_item, "Point"),
		 impl("", "Clone", "Point", {impl_fn("clone")}),
		 fn("main", {path({"Point"})})}
	));
	Program program(std::move(crates));

	Diagnostics diagnostics;
	Fusion fusion(program.catalog, {}, {}, diagnostics);
	BatchResolutionProvider provider(program.catalog);
	fusion.run(provider);
	EXPECT_EQ(diagnostics.count(DiagnosticKind::excluded_trait_impl), 1u);
	EXPECT_FALSE(fusion.get_table().is_required(
		program.id("app[bin]::{impl Clone for Point}::clone (Impl Fn)")
	));
}
