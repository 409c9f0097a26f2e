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
#include "policy.hh"

#include <slang/text/SourceManager.h>

#include <cstdio>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	// Operator interaction; nullopt means the operator cancelled.
	class Dialog {
	public:
		virtual ~Dialog() = default;

		virtual std::optional<size_t> select_option(
			std::string_view prompt,
			std::string_view help,
			const std::vector<std::string> &options
		) = 0;
		virtual std::optional<std::string> text_input(
			std::string_view prompt,
			std::string_view help,
			std::string_view initial_value
		) = 0;
		virtual bool confirm(
			std::string_view prompt, std::string_view help, bool default_value
		) = 0;
		virtual void write_output(std::string_view message) = 0;
	};

	/**
	 * @brief Line based dialog on a terminal.
	 *
	 * A selection is made by option number. Any other text is a query that
	 * filters and ranks the options by fuzzy matching; a query matching
	 * exactly one option selects it. An empty line picks the first listed
	 * option; `q` or end of input cancels.
	 */
	class ConsoleDialog : public Dialog {
	public:
		ConsoleDialog(std::istream &in, FILE *out) : in(in), out(out) {}

		std::optional<size_t> select_option(
			std::string_view prompt,
			std::string_view help,
			const std::vector<std::string> &options
		) override;
		std::optional<std::string> text_input(
			std::string_view prompt,
			std::string_view help,
			std::string_view initial_value
		) override;
		bool confirm(
			std::string_view prompt, std::string_view help, bool default_value
		) override;
		void write_output(std::string_view message) override;

	private:
		std::optional<std::string> read_line();

		std::istream &in;
		FILE *out;
	};

	enum class UserSelection {
		include_item = 0,
		exclude_item,
		include_all_items_of_block,
		exclude_all_items_of_block,
		show_item,
		show_usage_of_item,
	};

	// Asks the operator about every pending item of trait-free impl blocks.
	class DialogResolutionProvider : public ResolutionProvider {
	public:
		DialogResolutionProvider(
			const Catalog &catalog,
			const slang::SourceManager &source_manager,
			Dialog &dialog
		)
			: catalog(catalog), source_manager(source_manager), dialog(dialog) {}

		/**
		 * @exception rsfuse::FusionError (OperatorCancelled) if the operator
		 * quits.
		 */
		std::vector<ItemDecision>
		resolve(const std::vector<PendingBlock> &blocks) override;

		bool got_user_input() const { return user_input; }

	private:
		size_t select_block(const std::vector<PendingBlock> &blocks);
		UserSelection select_action(ItemId item, ItemId block);
		std::string show_item(ItemId item) const;
		std::string show_usage(const PendingItem &pending) const;

		const Catalog &catalog;
		const slang::SourceManager &source_manager;
		Dialog &dialog;
		bool user_input = false;
	};

	/**
	 * @brief Offers to write the configuration to a file.
	 *
	 * Overwriting an existing file needs confirmation. Cancelling skips
	 * saving without failing the run.
	 *
	 * @returns The path written to, if any.
	 */
	std::optional<std::filesystem::path> save_configuration_dialog(
		Dialog &dialog,
		const Configuration &config,
		const std::filesystem::path &default_path,
		bool verbose
	);
} // namespace rsfuse
