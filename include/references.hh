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

#include <slang/text/SourceLocation.h>

#include <string>
#include <vector>

namespace rsfuse {
	enum class ReferenceKind {
		path = 0,
		method,
		macro,
		use,
	};

	/**
	 * @brief A syntactic reference of an item to some other name.
	 *
	 * References are kept unresolved: a path stays a list of segments and a
	 * method call only knows its plain name. Which catalog item (or which of
	 * several impl blocks) is meant is decided by the graph builder.
	 */
	struct Reference {
		ReferenceKind kind = ReferenceKind::path;
		std::vector<std::string> segments;
		slang::SourceRange span;
		bool glob = false; // use

		const std::string &plain_name() const { return segments.back(); }
	};

	/**
	 * @brief Collects the references of an item's signature and body.
	 *
	 * For an impl block this is its header (trait, target type, bounds);
	 * the impl items are extracted one by one. A module has no references
	 * of its own.
	 *
	 * References realized only through trait dispatch (e.g. `Display::fmt`
	 * invoked by `write!`) are not visible in the syntax and cannot be
	 * found here.
	 */
	class ReferenceExtractor {
	public:
		std::vector<Reference> extract(const ItemNode &item) const;
		std::vector<Reference> extract(const ImplItemNode &item) const;

	private:
		void visit(
			const SyntaxNode &node, std::vector<Reference> &references
		) const;
	};
} // namespace rsfuse
