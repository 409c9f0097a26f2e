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

#include "references.hh"

std::vector<rsfuse::Reference>
rsfuse::ReferenceExtractor::extract(const ItemNode &item) const {
	std::vector<Reference> references;
	switch (item.kind) {
	case ItemKind::module:
	case ItemKind::crate_root:
		break;
	case ItemKind::use_item:
		for (auto &tree : item.trees) {
			Reference reference;
			reference.kind = ReferenceKind::use;
			reference.segments = tree.path;
			reference.span = tree.span;
			if (tree.is_glob()) {
				reference.glob = true;
			} else {
				reference.segments.push_back(tree.name);
			}
			if (!reference.segments.empty()) {
				references.push_back(std::move(reference));
			}
		}
		break;
	default:
		for (auto &node : item.syntax) {
			visit(node, references);
		}
		break;
	}
	return references;
}

std::vector<rsfuse::Reference>
rsfuse::ReferenceExtractor::extract(const ImplItemNode &item) const {
	std::vector<Reference> references;
	for (auto &node : item.syntax) {
		visit(node, references);
	}
	return references;
}

void rsfuse::ReferenceExtractor::visit(
	const SyntaxNode &node, std::vector<Reference> &references
) const {
	switch (node.kind) {
	case SyntaxKind::path:
		if (!node.segments.empty()) {
			references.push_back({ReferenceKind::path, node.segments, node.span}
			);
		}
		break;
	case SyntaxKind::method_call:
		if (!node.name.empty()) {
			references.push_back({ReferenceKind::method, {node.name}, node.span}
			);
		}
		break;
	case SyntaxKind::macro:
		if (!node.segments.empty()) {
			references.push_back({ReferenceKind::macro, node.segments, node.span}
			);
		} else if (!node.name.empty()) {
			references.push_back({ReferenceKind::macro, {node.name}, node.span}
			);
		}
		break;
	case SyntaxKind::group:
		break;
	}
	// generic arguments, call arguments and macro input
	for (auto &child : node.children) {
		visit(child, references);
	}
}
