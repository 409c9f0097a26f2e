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
#include "impl_name.hh"
#include "references.hh"

#include <slang/text/SourceLocation.h>

#include <tsl/ordered_map.h>

#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rsfuse {
	using ItemId = size_t;
	constexpr ItemId no_item = std::numeric_limits<ItemId>::max();

	/**
	 * @brief One top-level declaration, impl item, or crate root.
	 *
	 * Items are owned by the catalog and never change after it has been
	 * built; per-run state lives in a separate resolution table.
	 */
	struct Item {
		ItemId id = no_item;
		ItemKind kind = ItemKind::unsupported;
		std::string identity;
		std::string name; // plain name; the fully qualified name for impls
		std::string crate;
		CrateKind crate_kind = CrateKind::library;
		std::vector<std::string> module_path; // crate root excluded

		ItemId parent = no_item; // enclosing module or owning impl block
		ItemId crate_root = no_item;
		std::vector<ItemId> children;

		const ItemNode *node = nullptr;          // non impl items
		const ImplItemNode *impl_node = nullptr; // impl items
		slang::SourceRange span;
		std::vector<Reference> references;

		// impl blocks
		std::optional<ImplBlockName> block_name;
		std::string type_base;
		std::string trait_base;

		bool is_module() const {
			return kind == ItemKind::module || kind == ItemKind::crate_root;
		}
		bool is_impl_block() const { return kind == ItemKind::impl_block; }
		bool is_impl_item() const { return is_impl_item_kind(kind); }
		bool is_type() const {
			return kind == ItemKind::struct_item ||
				   kind == ItemKind::enum_item ||
				   kind == ItemKind::type_alias || kind == ItemKind::trait;
		}
		bool has_trait() const {
			return block_name.has_value() && block_name->has_trait();
		}

		void output(FILE *f = stderr) const;
	};

	/**
	 * @brief A flat, deduplicated collection of all items of all crates.
	 *
	 * Items are stored in insertion order: crate by crate, each module in
	 * pre-order, so that parents precede their children. This order is the
	 * stable order of every later stage.
	 */
	class Catalog {
	public:
		/**
		 * @brief Flattens the parsed crates into a catalog.
		 *
		 * A crate whose name was already catalogued is skipped. Test-only
		 * items (`#[cfg(test)]`, `mod tests`) are dropped.
		 *
		 * @exception rsfuse::FusionError (UnsupportedItemKind) for an item
		 * kind outside the supported set.
		 * @exception rsfuse::FusionError (DuplicateItemIdentity) if two items
		 * compute the same identity.
		 */
		static Catalog build(const std::vector<CrateNode> &crates);

		const Item &get(ItemId id) const { return items.at(id); }
		const std::vector<Item> &get_items() const { return items; }
		size_t size() const { return items.size(); }

		std::optional<ItemId> find_identity(std::string_view identity) const;
		std::optional<ItemId> find_crate(std::string_view name) const;
		std::optional<ItemId> get_binary_crate() const;

		// Non impl items of the given plain name, catalog-wide.
		const std::vector<ItemId> &items_named(std::string_view name) const;
		// Impl items of the given plain name, catalog-wide.
		const std::vector<ItemId> &
		impl_items_named(std::string_view name) const;
		// All impl blocks with this fully qualified name.
		std::vector<ItemId> impl_blocks_named(const ImplBlockName &name) const;
		// Children of a module with the given plain name.
		std::vector<ItemId>
		module_children_named(ItemId module, std::string_view name) const;

		std::vector<ItemId> owning_blocks(const std::vector<ItemId> &impl_items
		) const;

		/**
		 * @brief The configuration pattern naming an impl item: the plain name
		 * if it is unique among impl items, `name@block` otherwise.
		 */
		std::string impl_item_pattern(ItemId impl_item) const;

		std::vector<std::string> skipped_crates;

	private:
		ItemId add(Item item);
		void add_crate(const CrateNode &crate);
		void add_items(
			const std::vector<ItemNode> &nodes,
			const CrateNode &crate,
			ItemId parent,
			const std::vector<std::string> &module_path
		);
		void add_impl_block(
			const ItemNode &node,
			const CrateNode &crate,
			ItemId parent,
			const std::vector<std::string> &module_path
		);

		std::vector<Item> items;
		std::unordered_map<std::string, ItemId> by_identity;
		tsl::ordered_map<std::string, std::vector<ItemId>> by_name;
		tsl::ordered_map<std::string, std::vector<ItemId>> impl_items_by_name;
		tsl::ordered_map<std::string, ItemId> crates;
		ReferenceExtractor extractor;
	};
} // namespace rsfuse
