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

#include "crate_dump.hh"
#include "errors.hh"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

using namespace rsfuse;
namespace fs = std::filesystem;

static std::string read_text(const fs::path &path) {
	std::ifstream f(path, std::ios::binary);
	if (!f) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Could not open '{}'.", path.string())
		);
	}
	std::stringstream contents;
	contents << f.rdbuf();
	return contents.str();
}

static std::string optional_string(const nlohmann::json &j, const char *key) {
	if (!j.contains(key) || j[key].is_null()) {
		return "";
	}
	return j[key].get<std::string>();
}

std::vector<CrateNode> rsfuse::CrateDumpLoader::load(const fs::path &path) {
	auto text = read_text(path);
	nlohmann::json j;
	try {
		j = nlohmann::json::parse(text);
	} catch (nlohmann::json::exception &e) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Could not parse '{}': {}", path.string(), e.what())
		);
	}
	return parse(j, fs::absolute(path).parent_path());
}

std::vector<CrateNode>
rsfuse::CrateDumpLoader::parse(const nlohmann::json &j, const fs::path &base) {
	base_dir = base;
	std::vector<CrateNode> crates;
	try {
		for (auto &crate : j.at("crates")) {
			crates.push_back(parse_crate(crate));
		}
	} catch (nlohmann::json::exception &e) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Malformed crate dump: {}", e.what())
		);
	}
	return crates;
}

slang::BufferID rsfuse::CrateDumpLoader::add_source(
	const fs::path &path, std::string_view text
) {
	auto key = path.string();
	auto it = buffers.find(key);
	if (it != buffers.end()) {
		return it->second;
	}
	auto buffer = source_manager.assignText(key, text);
	buffers[key] = buffer.id;
	source_files.insert(path);
	return buffer.id;
}

slang::BufferID rsfuse::CrateDumpLoader::get_buffer(const std::string &file) {
	fs::path path(file);
	if (path.is_relative()) {
		path = base_dir / path;
	}
	path = path.lexically_normal();
	auto it = buffers.find(path.string());
	if (it != buffers.end()) {
		return it->second;
	}
	return add_source(path, read_text(path));
}

CrateNode rsfuse::CrateDumpLoader::parse_crate(const nlohmann::json &j) {
	CrateNode crate;
	crate.name = j.at("name").get<std::string>();
	auto kind = j.at("kind").get<std::string>();
	if (kind == "bin") {
		crate.kind = CrateKind::binary;
	} else if (kind == "lib") {
		crate.kind = CrateKind::library;
	} else {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Crate '{}' has unknown kind '{}'.", crate.name, kind)
		);
	}
	if (j.contains("items")) {
		for (auto &item : j["items"]) {
			crate.items.push_back(parse_item(item));
		}
	}
	return crate;
}

ItemNode rsfuse::CrateDumpLoader::parse_item(const nlohmann::json &j) {
	ItemNode item;
	item.raw_kind = j.at("kind").get<std::string>();
	item.kind = item_kind_from_string(item.raw_kind);
	item.name = optional_string(j, "name");
	item.vis = optional_string(j, "vis");
	if (j.contains("attrs")) {
		item.attrs = j["attrs"].get<std::vector<std::string>>();
	}
	item.span = parse_span(j.contains("span") ? j["span"] : nlohmann::json());
	if (j.contains("syntax")) {
		item.syntax = parse_syntax_list(j["syntax"]);
	}

	switch (item.kind) {
	case ItemKind::module:
		if (j.contains("items")) {
			for (auto &child : j["items"]) {
				item.items.push_back(parse_item(child));
			}
		}
		break;
	case ItemKind::enum_item:
		if (j.contains("variants")) {
			item.variants = j["variants"].get<std::vector<std::string>>();
		}
		break;
	case ItemKind::impl_block:
		item.impl.generics = optional_string(j, "generics");
		if (j.contains("trait") && !j["trait"].is_null()) {
			item.impl.trait_path = j["trait"].get<std::string>();
		}
		item.impl.self_type = j.at("self_ty").get<std::string>();
		item.impl.where_clause = optional_string(j, "where");
		item.impl.span = parse_span(
			j.contains("header_span") ? j["header_span"] : nlohmann::json()
		);
		if (j.contains("items")) {
			for (auto &child : j["items"]) {
				item.impl_items.push_back(parse_impl_item(child));
			}
		}
		break;
	case ItemKind::use_item:
		for (auto &tree : j.at("trees")) {
			item.trees.push_back(parse_use_tree(tree));
		}
		break;
	default:
		break;
	}
	return item;
}

ImplItemNode rsfuse::CrateDumpLoader::parse_impl_item(const nlohmann::json &j) {
	ImplItemNode item;
	item.raw_kind = j.at("kind").get<std::string>();
	item.kind = impl_item_kind_from_string(item.raw_kind);
	item.name = optional_string(j, "name");
	item.span = parse_span(j.contains("span") ? j["span"] : nlohmann::json());
	if (j.contains("syntax")) {
		item.syntax = parse_syntax_list(j["syntax"]);
	}
	return item;
}

std::vector<SyntaxNode>
rsfuse::CrateDumpLoader::parse_syntax_list(const nlohmann::json &j) {
	std::vector<SyntaxNode> nodes;
	for (auto &node : j) {
		nodes.push_back(parse_syntax(node));
	}
	return nodes;
}

SyntaxNode rsfuse::CrateDumpLoader::parse_syntax(const nlohmann::json &j) {
	SyntaxNode node;
	auto kind = j.at("kind").get<std::string>();
	if (kind == "path") {
		node.kind = SyntaxKind::path;
		node.segments = j.at("segments").get<std::vector<std::string>>();
	} else if (kind == "method_call") {
		node.kind = SyntaxKind::method_call;
		node.name = j.at("name").get<std::string>();
	} else if (kind == "macro") {
		node.kind = SyntaxKind::macro;
		if (j.contains("segments")) {
			node.segments = j["segments"].get<std::vector<std::string>>();
		}
		node.name = optional_string(j, "name");
	} else if (kind == "group") {
		node.kind = SyntaxKind::group;
	} else {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Unknown syntax node kind '{}'.", kind)
		);
	}
	if (j.contains("span")) {
		node.span = parse_span(j["span"]);
	}
	if (j.contains("children")) {
		node.children = parse_syntax_list(j["children"]);
	}
	return node;
}

UseTree rsfuse::CrateDumpLoader::parse_use_tree(const nlohmann::json &j) {
	UseTree tree;
	if (j.contains("path")) {
		tree.path = j["path"].get<std::vector<std::string>>();
	}
	tree.name = j.at("name").get<std::string>();
	if (j.contains("rename") && !j["rename"].is_null()) {
		tree.rename = j["rename"].get<std::string>();
	}
	if (j.contains("span")) {
		tree.span = parse_span(j["span"]);
	}
	return tree;
}

slang::SourceRange rsfuse::CrateDumpLoader::parse_span(const nlohmann::json &j
) {
	if (j.is_null()) {
		return slang::SourceRange();
	}
	auto buffer = get_buffer(j.at("file").get<std::string>());
	auto lo = j.at("lo").get<uint64_t>();
	auto hi = j.at("hi").get<uint64_t>();
	auto text = source_manager.getSourceText(buffer);
	if (lo > hi || hi > text.size()) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format(
				"Span {}..{} is outside of '{}'.",
				lo,
				hi,
				source_manager.getFullPath(buffer).string()
			)
		);
	}
	return slang::SourceRange(
		slang::SourceLocation(buffer, lo), slang::SourceLocation(buffer, hi)
	);
}

std::string_view rsfuse::source_text(
	const slang::SourceManager &source_manager, slang::SourceRange range
) {
	auto buffer = range.start().buffer();
	if (!buffer.valid()) {
		return "";
	}
	auto text = source_manager.getSourceText(buffer);
	auto lo = range.start().offset();
	auto hi = range.end().offset();
	if (lo > hi || hi > text.size()) {
		return "";
	}
	return text.substr(lo, hi - lo);
}
