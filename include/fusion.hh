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

#include "assembler.hh"
#include "catalog.hh"
#include "config.hh"
#include "errors.hh"
#include "graph.hh"
#include "policy.hh"
#include "reachability.hh"

#include <string>
#include <vector>

namespace rsfuse {
	struct FusionOptions {
		std::string entry = "main";
		PolicyOptions policy;
	};

	/**
	 * @brief One resolution pass over a catalog: graph, closure from the
	 * entry points, then conflict resolution.
	 */
	class Fusion {
	public:
		/**
		 * @exception rsfuse::FusionError for configuration errors, see
		 * ConflictPolicyEngine.
		 */
		Fusion(
			const Catalog &catalog,
			const Configuration &config,
			FusionOptions options,
			Diagnostics &diagnostics
		);
		Fusion(const Fusion &) = delete;
		Fusion &operator=(const Fusion &) = delete;

		/**
		 * @brief The entry function of the binary crate root, or any free
		 * function of that name if there is no binary crate.
		 *
		 * @exception rsfuse::FusionError (InputError) if there is none.
		 */
		std::vector<ItemId> find_entry_points() const;

		/**
		 * @brief Runs reachability and conflict resolution to completion.
		 *
		 * @exception rsfuse::FusionError (AmbiguousImplItemReference or
		 * OperatorCancelled) from the provider.
		 */
		void run(ResolutionProvider &provider);

		const DependencyGraph &get_graph() const { return graph; }
		const ResolutionTable &get_table() const { return table; }
		const Configuration &get_decisions() const {
			return engine.get_decisions();
		}
		FusionResult get_result() const { return assemble(catalog, table); }

	private:
		const Catalog &catalog;
		FusionOptions options;
		DependencyGraph graph;
		ResolutionTable table;
		ReachabilityAnalyzer analyzer;
		ConflictPolicyEngine engine;
	};
} // namespace rsfuse
