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

#include "catalog.hh"
#include "config.hh"
#include "errors.hh"
#include "policy.hh"

#include <slang/text/SourceManager.h>
#include <slang/util/CommandLine.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rsfuse {
	class Driver {
	public:
		Driver();

		void parse_cli(int argc, char *argv[]);

		/**
		 * @brief Loads the configuration and the crate dump and builds the
		 * item catalog.
		 *
		 * If a valid cache file is found, the fused output is re-populated
		 * from it and loading is skipped to save time.
		 *
		 * @exception rsfuse::FusionError for unreadable or malformed input
		 * and for catalog errors.
		 */
		void prepare();

		/**
		 * @brief Must be run after prepare().
		 *
		 * Resolves the required items, asking the operator about ambiguous
		 * impl items unless --batch is given, and renders the fused source.
		 * If the operator made decisions, offers to save them to the
		 * configuration.
		 *
		 * @exception rsfuse::FusionError if resolution fails or is
		 * cancelled. No output is produced in that case.
		 */
		void analyze();

		// Writes the fused source to --output, or stdout.
		void write_output() const;

		/**
		 * @brief Writes the final results to the file specified by --cache-to.
		 *
		 * Skipped if the operator made decisions that were not saved to the
		 * --config file, as a later run could not reproduce them.
		 */
		void try_write_cache() const;

	private:
		// methods
		bool load_cache();
		nlohmann::json get_options_fingerprint() const;
		Configuration get_cli_config() const;

		// members
		slang::CommandLine cmdLine;
		slang::SourceManager source_manager;
		std::set<std::filesystem::path> input_file_list;
		std::set<std::filesystem::path> source_file_list;
		bool cached = false;
		bool cacheable = true;
		std::vector<CrateNode> crates;
		std::unique_ptr<Catalog> catalog;
		Configuration file_config;
		Configuration config;
		PolicyOptions policy_options;
		Diagnostics diagnostics;
		std::optional<std::string> result;

		// cli
		std::optional<bool> show_help;
		std::optional<bool> show_version;
		std::optional<bool> batch;
		std::optional<bool> verbose;
		std::optional<bool> dump_graph;
		std::optional<std::string> input;
		std::optional<std::string> config_file;
		std::optional<std::string> entry;
		std::optional<std::string> output;
		std::optional<std::string> cache_file;
		std::optional<std::string> process_all_impl_items;
		std::vector<std::string> include_impl_items;
		std::vector<std::string> exclude_impl_items;
		std::vector<std::string> include_impl_blocks;
		std::vector<std::string> exclude_impl_blocks;
	};
} // namespace rsfuse
