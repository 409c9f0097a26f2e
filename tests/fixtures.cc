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

#include <gtest/gtest.h>

#include <stdexcept>

using namespace rsfuse;

rsfuse::SyntaxNode rsfuse::testing::path(
	std::vector<std::string> segments, std::vector<SyntaxNode> children
) {
	SyntaxNode node;
	node.kind = SyntaxKind::path;
	node.segments = std::move(segments);
	node.children = std::move(children);
	return node;
}

rsfuse::SyntaxNode
rsfuse::testing::method(std::string name, std::vector<SyntaxNode> children) {
	SyntaxNode node;
	node.kind = SyntaxKind::method_call;
	node.name = std::move(name);
	node.children = std::move(children);
	return node;
}

rsfuse::SyntaxNode
rsfuse::testing::macro(std::string name, std::vector<SyntaxNode> children) {
	SyntaxNode node;
	node.kind = SyntaxKind::macro;
	node.name = std::move(name);
	node.children = std::move(children);
	return node;
}

rsfuse::ItemNode rsfuse::testing::item(
	ItemKind kind, std::string name, std::vector<SyntaxNode> syntax
) {
	ItemNode node;
	node.kind = kind;
	node.name = std::move(name);
	node.syntax = std::move(syntax);
	return node;
}

rsfuse::ItemNode
rsfuse::testing::fn(std::string name, std::vector<SyntaxNode> syntax) {
	auto node = item(ItemKind::function, std::move(name), std::move(syntax));
	node.raw_kind = "fn";
	return node;
}

rsfuse::ItemNode rsfuse::testing::enumeration(
	std::string name, std::vector<std::string> variants
) {
	auto node = item(ItemKind::enum_item, std::move(name));
	node.raw_kind = "enum";
	node.variants = std::move(variants);
	return node;
}

rsfuse::ItemNode
rsfuse::testing::module_item(std::string name, std::vector<ItemNode> items) {
	auto node = item(ItemKind::module, std::move(name));
	node.raw_kind = "mod";
	node.items = std::move(items);
	return node;
}

rsfuse::ItemNode rsfuse::testing::use(std::vector<UseTree> trees) {
	ItemNode node;
	node.kind = ItemKind::use_item;
	node.raw_kind = "use";
	node.trees = std::move(trees);
	return node;
}

rsfuse::UseTree rsfuse::testing::tree(
	std::vector<std::string> path,
	std::string name,
	std::optional<std::string> rename
) {
	UseTree tree;
	tree.path = std::move(path);
	tree.name = std::move(name);
	tree.rename = std::move(rename);
	return tree;
}

rsfuse::ImplItemNode
rsfuse::testing::impl_fn(std::string name, std::vector<SyntaxNode> syntax) {
	ImplItemNode node;
	node.kind = ItemKind::impl_fn;
	node.raw_kind = "fn";
	node.name = std::move(name);
	node.syntax = std::move(syntax);
	return node;
}

rsfuse::ItemNode rsfuse::testing::impl(
	std::string generics,
	std::optional<std::string> trait_path,
	std::string self_type,
	std::vector<ImplItemNode> items,
	std::string where_clause
) {
	ItemNode node;
	node.kind = ItemKind::impl_block;
	node.raw_kind = "impl";
	node.impl.generics = std::move(generics);
	node.impl.trait_path = std::move(trait_path);
	node.impl.self_type = std::move(self_type);
	node.impl.where_clause = std::move(where_clause);
	node.impl_items = std::move(items);
	return node;
}

rsfuse::CrateNode
rsfuse::testing::binary(std::string name, std::vector<ItemNode> items) {
	return {std::move(name), CrateKind::binary, std::move(items)};
}

rsfuse::CrateNode
rsfuse::testing::library(std::string name, std::vector<ItemNode> items) {
	return {std::move(name), CrateKind::library, std::move(items)};
}

rsfuse::ItemId
rsfuse::testing::Program::id(std::string_view identity) const {
	auto found = catalog.find_identity(identity);
	if (!found.has_value()) {
		throw std::out_of_range("no item '" + std::string{identity} + "'");
	}
	return *found;
}

const char *const rsfuse::testing::map_block =
	"impl<T:Copy+Clone+Default,constX:usize,constY:usize,constN:usize> "
	"MyMap2D<T,X,Y,N>";

nlohmann::json rsfuse::testing::span_of(
	std::string_view file, std::string_view text, std::string_view snippet
) {
	auto lo = text.find(snippet);
	if (lo == std::string_view::npos) {
		throw std::out_of_range("no '" + std::string{snippet} + "' in source");
	}
	return {{"file", std::string{file}}, {"lo", lo}, {"hi", lo + snippet.size()}};
}

std::vector<rsfuse::CrateNode> rsfuse::testing::game_crates() {
	auto map_type = [] {
		return path(
			{"MyMap2D"},
			{path({"Value"}), path({"X"}), path({"Y"}), path({"N"})}
		);
	};

	auto library_crate = library(
		"my_map_two_dim",
		{
			item(ItemKind::struct_item, "MyMap2D", {path({"T"})}),
			impl(
				"<T: Copy + Clone + Default, const X: usize, const Y: usize, "
				"const N: usize>",
				std::nullopt,
				"MyMap2D<T, X, Y, N>",
				{
					impl_fn("new", {path({"Self"})}),
					impl_fn("get", {path({"T"})}),
					impl_fn("set", {path({"T"})}),
				}
			),
			impl(
				"<T: Copy + Clone + Default, const X: usize, const Y: usize, "
				"const N: usize>",
				"Default",
				"MyMap2D<T, X, Y, N>",
				{impl_fn("default", {path({"Self", "new"})})}
			),
		}
	);

	auto binary_crate = binary(
		"game",
		{
			use({tree({"my_map_two_dim"}, "MyMap2D")}),
			use({tree({"std"}, "fmt")}),
			use({tree({"std", "fmt"}, "Display")}),
			item(ItemKind::constant, "X"),
			item(ItemKind::constant, "Y"),
			item(ItemKind::constant, "N"),
			enumeration("Value", {"White", "Black"}),
			item(ItemKind::struct_item, "Go", {map_type()}),
			impl(
				"",
				"fmt::Display",
				"Go",
				{impl_fn(
					"fmt",
					{path({"fmt", "Formatter"}), path({"fmt", "Result"})}
				)}
			),
			impl(
				"",
				"Display",
				"Value",
				{impl_fn(
					"fmt",
					{path({"fmt", "Formatter"}),
					 path({"Value", "White"}),
					 path({"Self", "Black"})}
				)}
			),
			impl(
				"",
				std::nullopt,
				"Go",
				{
					impl_fn("new", {path({"MyMap2D", "default"})}),
					impl_fn("apply", {path({"Value"}), method("set")}),
					impl_fn("render", {method("fmt")}),
				}
			),
			item(ItemKind::struct_item, "Other"),
			impl("", std::nullopt, "Other", {impl_fn("set")}),
			fn("main",
			   {path({"Go", "new"}), method("apply"), method("render")}),
		}
	);

	std::vector<CrateNode> crates;
	crates.push_back(std::move(library_crate));
	crates.push_back(std::move(binary_crate));
	return crates;
}

std::optional<size_t> rsfuse::testing::ScriptedDialog::select_option(
	std::string_view prompt,
	std::string_view,
	const std::vector<std::string> &
) {
	prompts.emplace_back(prompt);
	if (selections.empty()) {
		ADD_FAILURE() << "Unexpected selection prompt: " << prompt;
		return std::nullopt;
	}
	auto answer = selections.front();
	selections.pop_front();
	return answer;
}

std::optional<std::string> rsfuse::testing::ScriptedDialog::text_input(
	std::string_view prompt, std::string_view, std::string_view initial_value
) {
	prompts.emplace_back(prompt);
	if (texts.empty()) {
		return std::string{initial_value};
	}
	auto answer = texts.front();
	texts.pop_front();
	return answer;
}

bool rsfuse::testing::ScriptedDialog::confirm(
	std::string_view prompt, std::string_view, bool default_value
) {
	prompts.emplace_back(prompt);
	if (confirmations.empty()) {
		return default_value;
	}
	auto answer = confirmations.front();
	confirmations.pop_front();
	return answer;
}

void rsfuse::testing::ScriptedDialog::write_output(std::string_view message) {
	outputs.emplace_back(message);
}

std::vector<rsfuse::ItemDecision> rsfuse::testing::FixedResolutionProvider::resolve(
	const std::vector<PendingBlock> &blocks
) {
	calls++;
	std::vector<ItemDecision> decisions;
	for (auto &block : blocks) {
		for (auto &pending : block.items) {
			asked.push_back(pending.item);
			decisions.push_back({pending.item, decision, false});
		}
	}
	return decisions;
}
