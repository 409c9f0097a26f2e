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

#include "fusion.hh"

#include <fmt/format.h>

using namespace rsfuse;

rsfuse::Fusion::Fusion(
	const Catalog &catalog,
	const Configuration &config,
	FusionOptions options,
	Diagnostics &diagnostics
)
	: catalog(catalog), options(options),
	  graph(GraphBuilder(catalog).build()), table(catalog.size()),
	  analyzer(catalog, graph, table, &diagnostics),
	  engine(catalog, config, options.policy, diagnostics) {}

std::vector<ItemId> rsfuse::Fusion::find_entry_points() const {
	std::vector<ItemId> entries;
	auto binary = catalog.get_binary_crate();
	for (auto id : catalog.items_named(options.entry)) {
		auto &item = catalog.get(id);
		if (item.kind != ItemKind::function) {
			continue;
		}
		if (!binary.has_value() || item.parent == *binary) {
			entries.push_back(id);
		}
	}
	if (entries.empty()) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Entry point function '{}' not found.", options.entry)
		);
	}
	return entries;
}

void rsfuse::Fusion::run(ResolutionProvider &provider) {
	auto entries = find_entry_points();
	auto forced = engine.get_forced_includes();
	entries.insert(entries.end(), forced.begin(), forced.end());
	analyzer.require_all(entries);
	if (options.policy.verbose) {
		fmt::println(
			stderr,
			"Structural closure: {} of {} items required, {} edges visited.",
			table.count(ResolutionState::required),
			catalog.size(),
			analyzer.get_edges_visited()
		);
	}
	engine.resolve(table, analyzer, provider);
}
