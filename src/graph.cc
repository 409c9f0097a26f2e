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

#include "graph.hh"
#include "impl_name.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

using namespace rsfuse;

size_t rsfuse::DependencyGraph::edge_count() const {
	size_t count = 0;
	for (auto &targets : edges) {
		count += targets.size();
	}
	return count;
}

void rsfuse::DependencyGraph::output(const Catalog &catalog, FILE *f) const {
	for (auto &item : catalog.get_items()) {
		item.output(f);
		fmt::println(f, "  edges:");
		for (auto target : edges[item.id]) {
			fmt::println(f, "    - {}", catalog.get(target).identity);
		}
		if (!ambiguous_by_source[item.id].empty()) {
			fmt::println(f, "  ambiguous:");
			for (auto edge_id : ambiguous_by_source[item.id]) {
				auto &edge = ambiguous[edge_id];
				fmt::println(f, "    - {}:", edge.name);
				for (auto candidate : edge.candidates) {
					fmt::println(f, "      - {}", catalog.get(candidate).identity);
				}
			}
		}
	}
	fflush(f);
}

DependencyGraph rsfuse::GraphBuilder::build() {
	graph = DependencyGraph();
	auto n = catalog.size();
	graph.edges.resize(n);
	graph.ambiguous_by_source.resize(n);
	graph.impl_blocks.resize(n);
	graph.target_types.assign(n, no_item);
	graph.traits.assign(n, no_item);
	graph.use_targets.resize(n);

	link_impl_blocks();
	for (auto &item : catalog.get_items()) {
		add_structure(item.id);
		if (item.kind == ItemKind::use_item) {
			add_use(item.id);
			continue;
		}
		for (auto &reference : item.references) {
			add_reference(item.id, reference);
		}
	}
	return std::move(graph);
}

// A use item has no edges of its own: whoever uses a name it introduces
// depends on the use item and on the imported item directly. That keeps
// unused imports of a required use item out of the closure.
void rsfuse::GraphBuilder::add_use(ItemId id) {
	auto &item = catalog.get(id);
	auto scope = module_of(id);
	auto &targets = graph.use_targets[id];
	for (auto &tree : item.node->trees) {
		auto segments = tree.path;
		if (!tree.is_glob() && tree.name != "self") {
			segments.push_back(tree.name);
		}
		std::vector<ItemId> resolved;
		if (!segments.empty()) {
			std::vector<ItemId> via;
			LookupGuard guard;
			auto target = resolve_segments(scope, segments, via, guard);
			resolved = target.items;
			if (target.assoc_type != no_item) {
				resolved.push_back(target.assoc_type);
			}
		}
		targets.push_back(std::move(resolved));
	}
}

void rsfuse::GraphBuilder::link_impl_blocks() {
	auto resolve_type = [&](ItemId block, std::string_view text) {
		auto segments = path_segments(text);
		if (segments.empty()) {
			return no_item;
		}
		std::vector<ItemId> via;
		LookupGuard guard;
		auto target = resolve_segments(module_of(block), segments, via, guard);
		for (auto id : target.items) {
			if (catalog.get(id).is_type()) {
				return id;
			}
		}
		// no single-segment fallback here: `impl Trait for i32` is external
		return no_item;
	};

	for (auto &item : catalog.get_items()) {
		if (!item.is_impl_block()) {
			continue;
		}
		auto &header = item.node->impl;
		auto type = resolve_type(item.id, header.self_type);
		graph.target_types[item.id] = type;
		if (type != no_item) {
			graph.impl_blocks[type].push_back(item.id);
		}
		if (header.trait_path.has_value()) {
			auto trait = resolve_type(item.id, *header.trait_path);
			if (trait != no_item && catalog.get(trait).kind == ItemKind::trait) {
				graph.traits[item.id] = trait;
				graph.impl_blocks[trait].push_back(item.id);
			}
		}
	}
}

void rsfuse::GraphBuilder::add_structure(ItemId id) {
	auto &item = catalog.get(id);
	if (item.parent != no_item) {
		// enclosing module, or owning block of an impl item
		add_edge(id, item.parent);
	}
	if (item.is_impl_block()) {
		if (graph.target_types[id] != no_item) {
			add_edge(id, graph.target_types[id]);
		}
		if (graph.traits[id] != no_item) {
			add_edge(id, graph.traits[id]);
		}
	}
}

void rsfuse::GraphBuilder::add_reference(ItemId id, const Reference &reference) {
	switch (reference.kind) {
	case ReferenceKind::path:
		add_path(id, reference);
		break;
	case ReferenceKind::use:
		break;
	case ReferenceKind::method: {
		std::vector<ItemId> candidates;
		for (auto candidate : catalog.impl_items_named(reference.plain_name())) {
			if (catalog.get(candidate).kind == ItemKind::impl_fn) {
				candidates.push_back(candidate);
			}
		}
		add_candidates(
			id, reference.plain_name(), std::move(candidates), reference.span
		);
		break;
	}
	case ReferenceKind::macro:
		for (auto candidate : catalog.items_named(reference.plain_name())) {
			if (catalog.get(candidate).kind == ItemKind::macro_rules) {
				add_edge(id, candidate);
			}
		}
		break;
	}
}

void rsfuse::GraphBuilder::add_path(ItemId id, const Reference &reference) {
	auto &segments = reference.segments;
	if (segments.empty()) {
		return;
	}

	if (segments[0] == "Self") {
		auto block = enclosing_block(id);
		if (block == no_item) {
			return;
		}
		auto type = graph.target_types[block];
		if (type != no_item) {
			add_edge(id, type);
		}
		if (segments.size() > 1) {
			add_associated(id, type, block, segments[1], reference.span);
		}
		return;
	}

	std::vector<ItemId> via;
	LookupGuard guard;
	auto scope = module_of(id);
	auto target = resolve_segments(scope, segments, via, guard);
	for (auto use : via) {
		add_edge(id, use);
	}
	for (auto target_id : target.items) {
		add_edge(id, target_id);
	}
	if (target.assoc_type != no_item) {
		add_edge(id, target.assoc_type);
		add_associated(
			id, target.assoc_type, no_item, target.assoc_name, reference.span
		);
		return;
	}
	if (target.items.empty() && !target.external && segments.size() == 1) {
		for (auto candidate : catalog.items_named(segments[0])) {
			if (!catalog.get(candidate).is_module()) {
				add_edge(id, candidate);
			}
		}
	}
}

void rsfuse::GraphBuilder::add_associated(
	ItemId id,
	ItemId type,
	ItemId block,
	const std::string &name,
	slang::SourceRange span
) {
	std::vector<ItemId> blocks;
	if (type != no_item) {
		auto &type_item = catalog.get(type);
		if (type_item.kind == ItemKind::enum_item) {
			auto &variants = type_item.node->variants;
			if (std::find(variants.begin(), variants.end(), name) !=
				variants.end()) {
				return;
			}
		}
		blocks = graph.impl_blocks[type];
	} else if (block != no_item) {
		// `Self::` of a block whose target lies outside the fused crates
		blocks.push_back(block);
	}

	std::vector<ItemId> candidates;
	for (auto block_id : blocks) {
		for (auto child : catalog.get(block_id).children) {
			if (catalog.get(child).name == name) {
				candidates.push_back(child);
			}
		}
	}
	add_candidates(id, name, std::move(candidates), span);
}

void rsfuse::GraphBuilder::add_candidates(
	ItemId id,
	const std::string &name,
	std::vector<ItemId> candidates,
	slang::SourceRange span
) {
	// an impl item calling a sibling of its own block is no ambiguity
	auto block = enclosing_block(id);
	if (candidates.size() > 1 && block != no_item) {
		for (auto candidate : candidates) {
			if (catalog.get(candidate).parent == block) {
				candidates = {candidate};
				break;
			}
		}
	}
	candidates.erase(
		std::remove(candidates.begin(), candidates.end(), id), candidates.end()
	);
	if (candidates.empty()) {
		return;
	}
	if (candidates.size() == 1) {
		add_edge(id, candidates[0]);
		return;
	}
	auto edge_id = graph.ambiguous.size();
	graph.ambiguous.push_back({id, name, std::move(candidates), span});
	graph.ambiguous_by_source[id].push_back(edge_id);
}

void rsfuse::GraphBuilder::add_edge(ItemId from, ItemId to) {
	if (from == to || to == no_item) {
		return;
	}
	graph.edges[from].insert(to);
}

GraphBuilder::LookupResult rsfuse::GraphBuilder::lookup(
	ItemId module,
	const std::string &name,
	std::vector<ItemId> &via,
	LookupGuard &guard
) const {
	auto key = std::make_pair(module, name);
	if (guard.count(key)) {
		return {};
	}
	guard.insert(key);
	struct Release {
		LookupGuard &guard;
		std::pair<ItemId, std::string> key;
		~Release() { guard.erase(key); }
	} release{guard, key};

	LookupResult result;
	result.items = catalog.module_children_named(module, name);
	if (!result.items.empty()) {
		return result;
	}

	auto &module_item = catalog.get(module);
	for (auto child : module_item.children) {
		auto &use = catalog.get(child);
		if (use.kind != ItemKind::use_item) {
			continue;
		}
		for (auto &tree : use.node->trees) {
			if (tree.is_glob()) {
				continue;
			}
			auto full_path = tree.path;
			std::string introduced;
			if (tree.name == "self") {
				if (full_path.empty()) {
					continue;
				}
				introduced = tree.rename.value_or(full_path.back());
			} else {
				full_path.push_back(tree.name);
				introduced = tree.introduced_name();
			}
			if (introduced != name) {
				continue;
			}

			std::vector<ItemId> inner_via;
			auto target = resolve_segments(module, full_path, inner_via, guard);
			via.push_back(child);
			via.insert(via.end(), inner_via.begin(), inner_via.end());
			if (target.assoc_type != no_item) {
				result.items = {target.assoc_type};
			} else {
				result.items = target.items;
			}
			result.external = result.items.empty();
			return result;
		}
	}

	for (auto child : module_item.children) {
		auto &use = catalog.get(child);
		if (use.kind != ItemKind::use_item) {
			continue;
		}
		for (auto &tree : use.node->trees) {
			if (!tree.is_glob() || tree.path.empty()) {
				continue;
			}
			std::vector<ItemId> inner_via;
			auto target = resolve_segments(module, tree.path, inner_via, guard);
			for (auto source : target.items) {
				auto &source_item = catalog.get(source);
				if (source_item.kind == ItemKind::enum_item) {
					auto &variants = source_item.node->variants;
					if (std::find(variants.begin(), variants.end(), name) !=
						variants.end()) {
						via.push_back(child);
						via.insert(via.end(), inner_via.begin(), inner_via.end());
						result.items = {source};
						return result;
					}
					continue;
				}
				if (!source_item.is_module()) {
					continue;
				}
				auto found = lookup(source, name, inner_via, guard);
				if (!found.items.empty() || found.external) {
					via.push_back(child);
					via.insert(via.end(), inner_via.begin(), inner_via.end());
					return found;
				}
			}
		}
	}
	return result;
}

GraphBuilder::PathTarget rsfuse::GraphBuilder::resolve_segments(
	ItemId scope,
	const std::vector<std::string> &segments,
	std::vector<ItemId> &via,
	LookupGuard &guard
) const {
	PathTarget result;
	auto current = scope;
	size_t i = 0;
	bool anchored = false;
	while (i < segments.size()) {
		auto &segment = segments[i];
		if (i == 0 && segment == "crate") {
			current = catalog.get(current).crate_root;
		} else if (i == 0 && segment == "self") {
			// current module
		} else if (segment == "super" && (i == 0 || anchored)) {
			current = parent_module(current);
			if (current == no_item) {
				return result;
			}
		} else {
			break;
		}
		anchored = true;
		i++;
	}
	if (i == segments.size()) {
		result.items = {current};
		return result;
	}

	auto found = lookup(current, segments[i], via, guard);
	if (found.items.empty() && !found.external && !anchored) {
		if (auto crate = catalog.find_crate(segments[i])) {
			found.items = {*crate};
		}
	}
	i++;

	for (; i < segments.size(); i++) {
		if (found.items.empty()) {
			break;
		}
		auto module = std::find_if(
			found.items.begin(), found.items.end(), [&](ItemId id) {
				return catalog.get(id).is_module();
			}
		);
		if (module != found.items.end()) {
			found = lookup(*module, segments[i], via, guard);
			continue;
		}
		auto type = std::find_if(
			found.items.begin(), found.items.end(), [&](ItemId id) {
				return catalog.get(id).is_type();
			}
		);
		if (type != found.items.end()) {
			result.assoc_type = *type;
			result.assoc_name = segments[i];
			return result;
		}
		// a value followed by more segments names nothing we know
		return result;
	}
	result.items = std::move(found.items);
	result.external = found.external;
	return result;
}

ItemId rsfuse::GraphBuilder::module_of(ItemId id) const {
	auto current = catalog.get(id).parent;
	while (current != no_item && !catalog.get(current).is_module()) {
		current = catalog.get(current).parent;
	}
	return current;
}

ItemId rsfuse::GraphBuilder::parent_module(ItemId module) const {
	if (catalog.get(module).kind == ItemKind::crate_root) {
		return no_item;
	}
	return module_of(module);
}

ItemId rsfuse::GraphBuilder::enclosing_block(ItemId id) const {
	auto &item = catalog.get(id);
	if (item.is_impl_block()) {
		return id;
	}
	if (item.is_impl_item()) {
		return item.parent;
	}
	return no_item;
}
