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

#include "catalog.hh"
#include "errors.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

using namespace rsfuse;

static const std::vector<ItemId> no_items;

static std::string crate_label(const CrateNode &crate) {
	if (crate.kind == CrateKind::binary) {
		return fmt::format("{}[bin]", crate.name);
	}
	return crate.name;
}

static std::string format_reference(const Reference &reference) {
	auto path = fmt::format("{}", fmt::join(reference.segments, "::"));
	switch (reference.kind) {
	case ReferenceKind::method:
		return fmt::format(".{}()", path);
	case ReferenceKind::macro:
		return fmt::format("{}!", path);
	case ReferenceKind::use:
		return fmt::format("use {}{}", path, reference.glob ? "::*" : "");
	case ReferenceKind::path:
		break;
	}
	return path;
}

void rsfuse::Item::output(FILE *f) const {
	fmt::println(f, "{}:", identity);
	fmt::println(f, "  kind: {}", to_string(kind));
	if (block_name.has_value()) {
		fmt::println(f, "  impl_block: {}", block_name->to_string());
	}
	fmt::println(f, "  references:");
	for (auto &reference : references) {
		fmt::println(f, "    - {}", format_reference(reference));
	}
	fflush(f);
}

Catalog rsfuse::Catalog::build(const std::vector<CrateNode> &crates) {
	Catalog catalog;
	for (auto &crate : crates) {
		catalog.add_crate(crate);
	}
	return catalog;
}

ItemId rsfuse::Catalog::add(Item item) {
	if (by_identity.count(item.identity)) {
		throw FusionError(
			ErrorKind::duplicate_item_identity,
			fmt::format(
				"Item identity '{}' is defined more than once.", item.identity
			)
		);
	}
	auto id = items.size();
	item.id = id;
	by_identity[item.identity] = id;
	if (item.is_impl_item()) {
		impl_items_by_name[item.name].push_back(id);
	} else if (item.kind != ItemKind::crate_root &&
			   item.kind != ItemKind::impl_block &&
			   item.kind != ItemKind::use_item) {
		by_name[item.name].push_back(id);
	}
	if (item.parent != no_item) {
		items[item.parent].children.push_back(id);
	}
	items.push_back(std::move(item));
	return id;
}

void rsfuse::Catalog::add_crate(const CrateNode &crate) {
	auto label = crate_label(crate);
	auto key = fmt::format("{} ({})", label, to_string(ItemKind::crate_root));
	if (by_identity.count(key)) {
		skipped_crates.push_back(label);
		return;
	}
	Item root;
	root.kind = ItemKind::crate_root;
	root.identity = key;
	root.name = crate.name;
	root.crate = crate.name;
	root.crate_kind = crate.kind;
	auto root_id = add(std::move(root));
	items[root_id].crate_root = root_id;
	if (crate.kind == CrateKind::library) {
		crates[crate.name] = root_id;
	}
	add_items(crate.items, crate, root_id, {});
}

void rsfuse::Catalog::add_items(
	const std::vector<ItemNode> &nodes,
	const CrateNode &crate,
	ItemId parent,
	const std::vector<std::string> &module_path
) {
	auto scope = fmt::format("{}", crate_label(crate));
	for (auto &segment : module_path) {
		scope += "::" + segment;
	}
	for (auto &node : nodes) {
		if (node.is_test_only()) {
			continue;
		}
		if (node.kind == ItemKind::unsupported) {
			throw FusionError(
				ErrorKind::unsupported_item_kind,
				fmt::format(
					"Item kind '{}'{} in '{}' is not supported.",
					node.raw_kind,
					node.name.empty() ? "" : fmt::format(" of '{}'", node.name),
					scope
				)
			);
		}
		if (node.kind == ItemKind::impl_block) {
			add_impl_block(node, crate, parent, module_path);
			continue;
		}

		Item item;
		item.kind = node.kind;
		item.name = node.kind == ItemKind::use_item ? "use" : node.name;
		item.crate = crate.name;
		item.crate_kind = crate.kind;
		item.module_path = module_path;
		item.parent = parent;
		item.crate_root = items[parent].crate_root;
		item.node = &node;
		item.span = node.span;
		item.references = extractor.extract(node);
		if (node.kind == ItemKind::use_item) {
			// use items have no name of their own
			item.identity = fmt::format(
				"{}::use#{} (Use)", scope, items[parent].children.size()
			);
		} else {
			item.identity =
				fmt::format("{}::{} ({})", scope, node.name, to_string(node.kind));
		}
		auto id = add(std::move(item));

		if (node.kind == ItemKind::module) {
			auto child_path = module_path;
			child_path.push_back(node.name);
			add_items(node.items, crate, id, child_path);
		}
	}
}

void rsfuse::Catalog::add_impl_block(
	const ItemNode &node,
	const CrateNode &crate,
	ItemId parent,
	const std::vector<std::string> &module_path
) {
	auto scope = fmt::format("{}", crate_label(crate));
	for (auto &segment : module_path) {
		scope += "::" + segment;
	}

	std::optional<std::string_view> trait_path;
	if (node.impl.trait_path.has_value()) {
		trait_path = *node.impl.trait_path;
	}
	auto block_name = ImplBlockName::from_components(
		node.impl.generics,
		trait_path,
		node.impl.self_type,
		node.impl.where_clause
	);
	auto fqn = block_name.to_string();

	Item block;
	block.kind = ItemKind::impl_block;
	block.name = fqn;
	block.crate = crate.name;
	block.crate_kind = crate.kind;
	block.module_path = module_path;
	block.parent = parent;
	block.crate_root = items[parent].crate_root;
	block.node = &node;
	block.span = node.span;
	block.references = extractor.extract(node);
	block.type_base = path_base_name(node.impl.self_type);
	if (node.impl.trait_path.has_value()) {
		block.trait_base = path_base_name(*node.impl.trait_path);
	}
	block.block_name = block_name;

	// Inherent impls of the same type may be repeated within a module.
	auto block_scope = fmt::format("{}::{{{}}}", scope, fqn);
	if (!block_name.has_trait()) {
		size_t ordinal = 1;
		while (by_identity.count(fmt::format("{} (Impl)", block_scope))) {
			ordinal++;
			block_scope = fmt::format("{}::{{{}}}#{}", scope, fqn, ordinal);
		}
	}
	block.identity = fmt::format("{} (Impl)", block_scope);
	auto block_id = add(std::move(block));

	for (auto &impl_node : node.impl_items) {
		if (impl_node.kind == ItemKind::unsupported || impl_node.name.empty()) {
			throw FusionError(
				ErrorKind::unsupported_item_kind,
				fmt::format(
					"Impl item kind '{}' in '{}' is not supported.",
					impl_node.raw_kind.empty() ? "<unnamed>" : impl_node.raw_kind,
					fqn
				)
			);
		}
		Item item;
		item.kind = impl_node.kind;
		item.name = impl_node.name;
		item.crate = crate.name;
		item.crate_kind = crate.kind;
		item.module_path = module_path;
		item.parent = block_id;
		item.crate_root = items[parent].crate_root;
		item.impl_node = &impl_node;
		item.span = impl_node.span;
		item.references = extractor.extract(impl_node);
		item.identity = fmt::format(
			"{}::{} ({})", block_scope, impl_node.name, to_string(impl_node.kind)
		);
		add(std::move(item));
	}
}

std::optional<ItemId>
rsfuse::Catalog::find_identity(std::string_view identity) const {
	auto it = by_identity.find(std::string{identity});
	if (it == by_identity.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<ItemId> rsfuse::Catalog::find_crate(std::string_view name
) const {
	auto it = crates.find(std::string{name});
	if (it == crates.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<ItemId> rsfuse::Catalog::get_binary_crate() const {
	for (auto &item : items) {
		if (item.kind == ItemKind::crate_root &&
			item.crate_kind == CrateKind::binary) {
			return item.id;
		}
	}
	return std::nullopt;
}

const std::vector<ItemId> &rsfuse::Catalog::items_named(std::string_view name
) const {
	auto it = by_name.find(std::string{name});
	if (it == by_name.end()) {
		return no_items;
	}
	return it->second;
}

const std::vector<ItemId> &
rsfuse::Catalog::impl_items_named(std::string_view name) const {
	auto it = impl_items_by_name.find(std::string{name});
	if (it == impl_items_by_name.end()) {
		return no_items;
	}
	return it->second;
}

std::vector<ItemId>
rsfuse::Catalog::impl_blocks_named(const ImplBlockName &name) const {
	std::vector<ItemId> result;
	for (auto &item : items) {
		if (item.block_name.has_value() && *item.block_name == name) {
			result.push_back(item.id);
		}
	}
	return result;
}

std::vector<ItemId> rsfuse::Catalog::module_children_named(
	ItemId module, std::string_view name
) const {
	std::vector<ItemId> result;
	for (auto child : items.at(module).children) {
		auto &item = items[child];
		if (item.kind == ItemKind::use_item ||
			item.kind == ItemKind::impl_block) {
			continue;
		}
		if (item.name == name) {
			result.push_back(child);
		}
	}
	return result;
}

std::vector<ItemId>
rsfuse::Catalog::owning_blocks(const std::vector<ItemId> &impl_items) const {
	std::vector<ItemId> blocks;
	for (auto id : impl_items) {
		auto parent = items.at(id).parent;
		if (std::find(blocks.begin(), blocks.end(), parent) == blocks.end()) {
			blocks.push_back(parent);
		}
	}
	return blocks;
}

std::string rsfuse::Catalog::impl_item_pattern(ItemId impl_item) const {
	auto &item = items.at(impl_item);
	if (owning_blocks(impl_items_named(item.name)).size() <= 1) {
		return item.name;
	}
	return fmt::format("{}@{}", item.name, items[item.parent].name);
}
