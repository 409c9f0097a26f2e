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

#include "assembler.hh"
#include "crate_dump.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>

using namespace rsfuse;

FusionResult rsfuse::assemble(const Catalog &catalog, const ResolutionTable &table) {
	FusionResult result;
	for (auto &item : catalog.get_items()) {
		auto state = table.get(item.id);
		if (state == ResolutionState::pending ||
			state == ResolutionState::undecided) {
			throw std::logic_error(fmt::format(
				"Item '{}' is still {} after resolution.",
				item.identity,
				to_string(state)
			));
		}
		if (state == ResolutionState::required) {
			result.items.insert(item.id);
		}
	}
	return result;
}

static std::string indent(size_t depth) {
	return std::string(depth * 4, ' ');
}

std::string rsfuse::Emitter::emit(const FusionResult &result) const {
	std::string out;
	for (auto id : result.items) {
		auto &item = catalog.get(id);
		if (item.kind != ItemKind::crate_root) {
			continue;
		}
		if (!out.empty()) {
			out += "\n";
		}
		if (item.crate_kind == CrateKind::binary) {
			emit_children(id, result, out, 0);
		} else {
			out += fmt::format("pub mod {} {{\n", item.crate);
			emit_children(id, result, out, 1);
			out += "}\n";
		}
	}
	return out;
}

void rsfuse::Emitter::emit_children(
	ItemId parent, const FusionResult &result, std::string &out, size_t depth
) const {
	bool first = true;
	for (auto child : catalog.get(parent).children) {
		if (!result.contains(child)) {
			continue;
		}
		auto &item = catalog.get(child);
		// consecutive use statements stay together
		if (!first && item.kind != ItemKind::use_item) {
			out += "\n";
		}
		first = false;
		emit_item(child, result, out, depth);
	}
}

void rsfuse::Emitter::emit_item(
	ItemId id, const FusionResult &result, std::string &out, size_t depth
) const {
	auto &item = catalog.get(id);
	switch (item.kind) {
	case ItemKind::use_item:
		emit_use(id, result, out, depth);
		return;
	case ItemKind::module: {
		auto &vis = item.node->vis;
		out += fmt::format(
			"{}{}{}mod {} {{\n",
			indent(depth),
			vis,
			vis.empty() ? "" : " ",
			item.name
		);
		emit_children(id, result, out, depth + 1);
		out += indent(depth) + "}\n";
		return;
	}
	case ItemKind::impl_block: {
		auto &header = item.node->impl;
		auto header_text = rewrite(item, item.node->syntax, header.span);
		if (header_text.empty()) {
			header_text = fmt::format(
				"impl{} {}{}{}{}",
				header.generics,
				header.trait_path.has_value() ? *header.trait_path + " for " : "",
				header.self_type,
				header.where_clause.empty() ? "" : " ",
				header.where_clause
			);
		}
		while (!header_text.empty() &&
			   (header_text.back() == ' ' || header_text.back() == '\n')) {
			header_text.pop_back();
		}
		out += fmt::format("{}{} {{\n", indent(depth), header_text);
		for (auto child : item.children) {
			if (!result.contains(child)) {
				continue;
			}
			auto &impl_item = catalog.get(child);
			out += fmt::format(
				"{}{}\n",
				indent(depth + 1),
				rewrite(impl_item, impl_item.impl_node->syntax, impl_item.span)
			);
		}
		out += indent(depth) + "}\n";
		return;
	}
	default:
		break;
	}

	auto text = rewrite(item, item.node->syntax, item.span);
	if (!text.empty()) {
		out += fmt::format("{}{}\n", indent(depth), text);
	}
}

void rsfuse::Emitter::emit_use(
	ItemId id, const FusionResult &result, std::string &out, size_t depth
) const {
	auto &item = catalog.get(id);
	auto &targets = graph.get_use_targets(id);
	auto &vis = item.node->vis;
	for (size_t i = 0; i < item.node->trees.size(); i++) {
		auto &tree = item.node->trees[i];
		auto &imported = targets.at(i);
		// imports of unfused items would not resolve
		if (!imported.empty() &&
			std::none_of(imported.begin(), imported.end(), [&](ItemId target) {
				return result.contains(target);
			})) {
			continue;
		}

		auto segments = tree.path;
		if (tree.name != "self") {
			segments.push_back(tree.name);
		}
		if (segments.empty()) {
			continue;
		}
		auto path = fmt::format("{}", fmt::join(segments, "::"));
		auto fix = path_prefix_fix(item, segments.front());
		if (segments.front() == "crate") {
			path.insert(5, fix);
		} else {
			path.insert(0, fix);
		}
		out += fmt::format(
			"{}{}{}use {}{};\n",
			indent(depth),
			vis,
			vis.empty() ? "" : " ",
			path,
			tree.rename.has_value() ? " as " + *tree.rename : ""
		);
	}
}

// Text to insert into a path starting with `first` so that it resolves
// inside the fused file.
std::string rsfuse::Emitter::path_prefix_fix(
	const Item &item, const std::string &first
) const {
	bool library = item.crate_kind == CrateKind::library;
	if (first == "crate") {
		return library ? "::" + item.crate : "";
	}
	if (!catalog.find_crate(first).has_value()) {
		return "";
	}
	// fused crates sit at the root of the output
	if (!library && item.module_path.empty()) {
		return "";
	}
	auto scope = item.parent;
	while (scope != no_item && !catalog.get(scope).is_module()) {
		scope = catalog.get(scope).parent;
	}
	if (scope != no_item && !catalog.module_children_named(scope, first).empty()) {
		return ""; // a local item shadows the crate name
	}
	return "crate::";
}

void rsfuse::Emitter::collect_edits(
	const Item &item,
	const std::vector<SyntaxNode> &syntax,
	slang::SourceRange range,
	std::vector<Edit> &edits
) const {
	auto text = source_text(source_manager, range);
	for (auto &node : syntax) {
		if (node.kind == SyntaxKind::path && !node.segments.empty() &&
			node.span.start().buffer() == range.start().buffer()) {
			auto &first = node.segments.front();
			auto start = node.span.start().offset();
			if (start >= range.start().offset() &&
				start < range.end().offset()) {
				auto offset = start - range.start().offset();
				if (text.substr(offset).starts_with(first)) {
					auto fix = path_prefix_fix(item, first);
					if (!fix.empty()) {
						auto at = first == "crate" ? offset + first.size()
												   : offset;
						edits.push_back({at, fix});
					}
				}
			}
		}
		collect_edits(item, node.children, range, edits);
	}
}

std::string rsfuse::Emitter::rewrite(
	const Item &item,
	const std::vector<SyntaxNode> &syntax,
	slang::SourceRange range
) const {
	std::string text{source_text(source_manager, range)};
	if (text.empty()) {
		return text;
	}
	std::vector<Edit> edits;
	collect_edits(item, syntax, range, edits);
	std::stable_sort(edits.begin(), edits.end(), [](auto &a, auto &b) {
		return a.offset > b.offset;
	});
	size_t last = std::string::npos;
	for (auto &edit : edits) {
		if (edit.offset == last) {
			continue; // nested nodes may report the same path twice
		}
		text.insert(edit.offset, edit.insertion);
		last = edit.offset;
	}
	return text;
}
