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

#include "ast.hh"

#include <algorithm>
#include <cctype>

static std::string squeeze(std::string_view text) {
	std::string result;
	for (auto c : text) {
		if (!std::isspace(static_cast<unsigned char>(c))) {
			result.push_back(c);
		}
	}
	return result;
}

rsfuse::ItemKind rsfuse::item_kind_from_string(std::string_view kind) {
	if (kind == "fn") {
		return ItemKind::function;
	}
	if (kind == "const") {
		return ItemKind::constant;
	}
	if (kind == "static") {
		return ItemKind::static_item;
	}
	if (kind == "type") {
		return ItemKind::type_alias;
	}
	if (kind == "struct") {
		return ItemKind::struct_item;
	}
	if (kind == "enum") {
		return ItemKind::enum_item;
	}
	if (kind == "trait") {
		return ItemKind::trait;
	}
	if (kind == "mod") {
		return ItemKind::module;
	}
	if (kind == "impl") {
		return ItemKind::impl_block;
	}
	if (kind == "use") {
		return ItemKind::use_item;
	}
	if (kind == "macro_rules") {
		return ItemKind::macro_rules;
	}
	return ItemKind::unsupported;
}

rsfuse::ItemKind rsfuse::impl_item_kind_from_string(std::string_view kind) {
	if (kind == "fn") {
		return ItemKind::impl_fn;
	}
	if (kind == "const") {
		return ItemKind::impl_const;
	}
	if (kind == "type") {
		return ItemKind::impl_type;
	}
	if (kind == "macro") {
		return ItemKind::impl_macro;
	}
	return ItemKind::unsupported;
}

std::string_view rsfuse::to_string(ItemKind kind) {
	switch (kind) {
	case ItemKind::unsupported:
		return "Unsupported";
	case ItemKind::crate_root:
		return "Crate";
	case ItemKind::function:
		return "Fn";
	case ItemKind::constant:
		return "Const";
	case ItemKind::static_item:
		return "Static";
	case ItemKind::type_alias:
		return "Type";
	case ItemKind::struct_item:
		return "Struct";
	case ItemKind::enum_item:
		return "Enum";
	case ItemKind::trait:
		return "Trait";
	case ItemKind::module:
		return "Mod";
	case ItemKind::impl_block:
		return "Impl";
	case ItemKind::use_item:
		return "Use";
	case ItemKind::macro_rules:
		return "Macro";
	case ItemKind::impl_fn:
		return "Impl Fn";
	case ItemKind::impl_const:
		return "Impl Const";
	case ItemKind::impl_type:
		return "Impl Type";
	case ItemKind::impl_macro:
		return "Impl Macro";
	}
	return "Unsupported";
}

bool rsfuse::is_impl_item_kind(ItemKind kind) {
	return kind == ItemKind::impl_fn || kind == ItemKind::impl_const ||
		   kind == ItemKind::impl_type || kind == ItemKind::impl_macro;
}

bool rsfuse::ItemNode::has_attr(std::string_view attr) const {
	auto wanted = squeeze(attr);
	return std::any_of(attrs.begin(), attrs.end(), [&](const std::string &a) {
		return squeeze(a) == wanted;
	});
}

bool rsfuse::ItemNode::is_test_only() const {
	if (has_attr("#[cfg(test)]")) {
		return true;
	}
	return kind == ItemKind::module && name == "tests";
}
