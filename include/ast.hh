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

#include <slang/text/SourceLocation.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	enum class ItemKind {
		unsupported = 0,
		crate_root,
		function,
		constant,
		static_item,
		type_alias,
		struct_item,
		enum_item,
		trait,
		module,
		impl_block,
		use_item,
		macro_rules,
		impl_fn,
		impl_const,
		impl_type,
		impl_macro,
	};

	ItemKind item_kind_from_string(std::string_view kind);
	ItemKind impl_item_kind_from_string(std::string_view kind);
	std::string_view to_string(ItemKind kind);
	bool is_impl_item_kind(ItemKind kind);

	enum class CrateKind {
		binary = 0,
		library,
	};

	enum class SyntaxKind {
		group = 0,
		path,
		method_call,
		macro,
	};

	/**
	 * @brief A node of an item's signature or body as delivered by the parser
	 * front end.
	 *
	 * Only the parts relevant for dependency analysis survive: paths (value,
	 * type and trait paths), method calls and macro invocations. Everything
	 * else is collapsed into groups that only carry children.
	 */
	struct SyntaxNode {
		SyntaxKind kind = SyntaxKind::group;
		std::vector<std::string> segments; // path
		std::string name;                  // method_call, macro
		slang::SourceRange span;
		std::vector<SyntaxNode> children;
	};

	// One leaf of a use tree: `use a::b::{c, d as e, f::*}` yields three.
	struct UseTree {
		std::vector<std::string> path;
		std::string name;
		std::optional<std::string> rename;
		slang::SourceRange span;

		bool is_glob() const { return name == "*"; }
		const std::string &introduced_name() const {
			return rename.has_value() ? *rename : name;
		}
	};

	// Raw component texts of `impl<..> Trait for Type where ..`
	struct ImplHeader {
		std::string generics;
		std::optional<std::string> trait_path;
		std::string self_type;
		std::string where_clause;
		slang::SourceRange span;
	};

	struct ImplItemNode {
		ItemKind kind = ItemKind::impl_fn;
		std::string raw_kind;
		std::string name;
		slang::SourceRange span;
		std::vector<SyntaxNode> syntax;
	};

	struct ItemNode {
		ItemKind kind = ItemKind::unsupported;
		std::string raw_kind;
		std::string name;
		std::string vis;
		std::vector<std::string> attrs;
		slang::SourceRange span;
		std::vector<SyntaxNode> syntax;

		// module
		std::vector<ItemNode> items;

		// enum
		std::vector<std::string> variants;

		// impl block
		ImplHeader impl;
		std::vector<ImplItemNode> impl_items;

		// use
		std::vector<UseTree> trees;

		bool has_attr(std::string_view attr) const;
		bool is_test_only() const;
	};

	struct CrateNode {
		std::string name;
		CrateKind kind = CrateKind::library;
		std::vector<ItemNode> items;
	};
} // namespace rsfuse
