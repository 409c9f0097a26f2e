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
#include "catalog.hh"
#include "dialog.hh"
#include "policy.hh"

#include <nlohmann/json.hpp>

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rsfuse::testing {
	SyntaxNode path(
		std::vector<std::string> segments, std::vector<SyntaxNode> children = {}
	);
	SyntaxNode method(std::string name, std::vector<SyntaxNode> children = {});
	SyntaxNode macro(std::string name, std::vector<SyntaxNode> children = {});

	ItemNode item(
		ItemKind kind, std::string name, std::vector<SyntaxNode> syntax = {}
	);
	ItemNode fn(std::string name, std::vector<SyntaxNode> syntax = {});
	ItemNode enumeration(std::string name, std::vector<std::string> variants);
	ItemNode module_item(std::string name, std::vector<ItemNode> items);
	ItemNode use(std::vector<UseTree> trees);
	UseTree tree(
		std::vector<std::string> path,
		std::string name,
		std::optional<std::string> rename = std::nullopt
	);
	ImplItemNode impl_fn(std::string name, std::vector<SyntaxNode> syntax = {});
	ItemNode impl(
		std::string generics,
		std::optional<std::string> trait_path,
		std::string self_type,
		std::vector<ImplItemNode> items,
		std::string where_clause = ""
	);

	CrateNode binary(std::string name, std::vector<ItemNode> items);
	CrateNode library(std::string name, std::vector<ItemNode> items);

	// Crates together with their catalog; the catalog points into the crates.
	struct Program {
		explicit Program(std::vector<CrateNode> input)
			: crates(std::move(input)), catalog(Catalog::build(crates)) {}
		Program(const Program &) = delete;
		Program &operator=(const Program &) = delete;

		ItemId id(std::string_view identity) const;

		std::vector<CrateNode> crates;
		Catalog catalog;
	};

	/**
	 * @brief A game binary using a generic two-dimensional map library.
	 *
	 * `Go::apply` calls `.set()`, which exists on the generic map and on the
	 * unrelated `Other`. `Go::render` calls `.fmt()`, implemented by
	 * `impl fmt::Display for Go` and `impl Display for Value`.
	 */
	std::vector<CrateNode> game_crates();

	extern const char *const map_block;

	// Crate dump span of the first occurrence of `snippet` in `text`.
	nlohmann::json
	span_of(std::string_view file, std::string_view text, std::string_view snippet);

	class ScriptedDialog : public Dialog {
	public:
		std::optional<size_t> select_option(
			std::string_view prompt,
			std::string_view help,
			const std::vector<std::string> &options
		) override;
		std::optional<std::string> text_input(
			std::string_view prompt,
			std::string_view help,
			std::string_view initial_value
		) override;
		bool confirm(
			std::string_view prompt, std::string_view help, bool default_value
		) override;
		void write_output(std::string_view message) override;

		std::deque<std::optional<size_t>> selections;
		std::deque<std::optional<std::string>> texts;
		std::deque<bool> confirmations;

		std::vector<std::string> prompts;
		std::vector<std::string> outputs;
	};

	// Answers every request with one fixed decision per item.
	class FixedResolutionProvider : public ResolutionProvider {
	public:
		explicit FixedResolutionProvider(Decision decision)
			: decision(decision) {}

		std::vector<ItemDecision>
		resolve(const std::vector<PendingBlock> &blocks) override;

		size_t calls = 0;
		std::vector<ItemId> asked;

	private:
		Decision decision;
	};
} // namespace rsfuse::testing
