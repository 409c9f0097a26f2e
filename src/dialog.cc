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

#include "dialog.hh"
#include "crate_dump.hh"
#include "errors.hh"
#include "fuzzy.hh"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

using namespace rsfuse;
namespace fs = std::filesystem;

static std::string trim(std::string_view text) {
	auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string_view::npos) {
		return "";
	}
	auto last = text.find_last_not_of(" \t\r\n");
	return std::string{text.substr(first, last - first + 1)};
}

static bool is_number(std::string_view text) {
	return !text.empty() &&
		   std::all_of(text.begin(), text.end(), [](char c) {
			   return std::isdigit(static_cast<unsigned char>(c)) != 0;
		   });
}

std::optional<std::string> rsfuse::ConsoleDialog::read_line() {
	std::string line;
	if (!std::getline(in, line)) {
		return std::nullopt;
	}
	return trim(line);
}

std::optional<size_t> rsfuse::ConsoleDialog::select_option(
	std::string_view prompt,
	std::string_view help,
	const std::vector<std::string> &options
) {
	if (options.empty()) {
		return std::nullopt;
	}
	std::vector<size_t> shown(options.size());
	for (size_t i = 0; i < options.size(); i++) {
		shown[i] = i;
	}

	while (true) {
		fmt::println(out, "? {}", prompt);
		for (size_t i = 0; i < shown.size(); i++) {
			fmt::println(out, "  {}) {}", i + 1, options[shown[i]]);
		}
		fmt::println(out, "[{}]", help);
		fflush(out);

		auto line = read_line();
		if (!line.has_value() || *line == "q") {
			return std::nullopt;
		}
		if (line->empty()) {
			return shown.front();
		}
		if (is_number(*line)) {
			size_t number = 0;
			auto end = line->data() + line->size();
			auto [ptr, ec] = std::from_chars(line->data(), end, number);
			if (ec == std::errc{} && ptr == end && number >= 1 &&
				number <= shown.size()) {
				return shown[number - 1];
			}
			fmt::println(out, "No option {}.", *line);
			continue;
		}

		auto matches = fuzzy_rank(options, *line);
		if (matches.empty()) {
			fmt::println(out, "Nothing matches '{}'.", *line);
			continue;
		}
		if (matches.size() == 1) {
			return matches.front().index;
		}
		shown.clear();
		for (auto &match : matches) {
			shown.push_back(match.index);
		}
	}
}

std::optional<std::string> rsfuse::ConsoleDialog::text_input(
	std::string_view prompt,
	std::string_view help,
	std::string_view initial_value
) {
	fmt::println(out, "? {} ({})", prompt, initial_value);
	fmt::println(out, "[{}]", help);
	fflush(out);
	auto line = read_line();
	if (!line.has_value() || *line == "q") {
		return std::nullopt;
	}
	if (line->empty()) {
		if (initial_value.empty()) {
			return std::nullopt;
		}
		return std::string{initial_value};
	}
	return line;
}

bool rsfuse::ConsoleDialog::confirm(
	std::string_view prompt, std::string_view help, bool default_value
) {
	fmt::println(out, "? {} {}", prompt, default_value ? "(Y/n)" : "(y/N)");
	fmt::println(out, "[{}]", help);
	fflush(out);
	auto line = read_line();
	if (!line.has_value() || line->empty()) {
		return default_value;
	}
	auto answer = *line;
	std::transform(answer.begin(), answer.end(), answer.begin(), [](char c) {
		return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	});
	if (answer == "y" || answer == "yes") {
		return true;
	}
	if (answer == "n" || answer == "no") {
		return false;
	}
	return default_value;
}

void rsfuse::ConsoleDialog::write_output(std::string_view message) {
	fmt::print(out, "{}", message);
	fflush(out);
}

std::vector<ItemDecision> rsfuse::DialogResolutionProvider::resolve(
	const std::vector<PendingBlock> &blocks
) {
	std::vector<ItemDecision> decisions;
	if (blocks.empty()) {
		return decisions;
	}
	user_input = true;
	auto &pending_block = blocks[select_block(blocks)];

	for (size_t i = 0; i < pending_block.items.size(); i++) {
		auto &pending = pending_block.items[i];
		bool decided = false;
		while (!decided) {
			auto selection = select_action(pending.item, pending_block.block);
			switch (selection) {
			case UserSelection::include_item:
				decisions.push_back({pending.item, Decision::include, false});
				decided = true;
				break;
			case UserSelection::exclude_item:
				decisions.push_back({pending.item, Decision::exclude, false});
				decided = true;
				break;
			case UserSelection::include_all_items_of_block:
			case UserSelection::exclude_all_items_of_block: {
				auto decision =
					selection == UserSelection::include_all_items_of_block
						? Decision::include
						: Decision::exclude;
				for (size_t j = i; j < pending_block.items.size(); j++) {
					decisions.push_back(
						{pending_block.items[j].item, decision, true}
					);
				}
				return decisions;
			}
			case UserSelection::show_item:
				dialog.write_output(show_item(pending.item));
				break;
			case UserSelection::show_usage_of_item:
				dialog.write_output(show_usage(pending));
				break;
			}
		}
	}
	return decisions;
}

size_t rsfuse::DialogResolutionProvider::select_block(
	const std::vector<PendingBlock> &blocks
) {
	if (blocks.size() == 1) {
		return 0;
	}
	std::vector<std::string> options;
	for (auto &block : blocks) {
		options.push_back(fmt::format(
			"{} ({} pending)", catalog.get(block.block).name, block.items.size()
		));
	}
	auto selection = dialog.select_option(
		"Select the impl block to decide on next.",
		"enter number or type to filter, q to quit",
		options
	);
	if (!selection.has_value()) {
		throw FusionError(
			ErrorKind::operator_cancelled, "Impl block selection cancelled."
		);
	}
	return *selection;
}

UserSelection
rsfuse::DialogResolutionProvider::select_action(ItemId item, ItemId block) {
	auto &item_name = catalog.get(item).name;
	auto &block_name = catalog.get(block).name;
	auto prompt =
		fmt::format("Found '{}' of required '{}'.", item_name, block_name);
	std::vector<std::string> options{
		fmt::format("Include '{}'.", item_name),
		fmt::format("Exclude '{}'.", item_name),
		fmt::format("Include all items of '{}'.", block_name),
		fmt::format("Exclude all items of '{}'.", block_name),
		fmt::format("Show code of '{}'.", item_name),
		fmt::format("Show usage of '{}'.", item_name),
	};
	auto selection = dialog.select_option(
		prompt, "enter number or type to filter, q to quit", options
	);
	if (!selection.has_value()) {
		throw FusionError(
			ErrorKind::operator_cancelled,
			fmt::format("Impl item dialog for '{}' cancelled.", item_name)
		);
	}
	return static_cast<UserSelection>(*selection);
}

std::string rsfuse::DialogResolutionProvider::show_item(ItemId id) const {
	auto &item = catalog.get(id);
	auto text = source_text(source_manager, item.span);
	if (text.empty()) {
		return fmt::format("No source code available for '{}'.\n", item.identity);
	}
	return fmt::format(
		"\n{}\n{}\n\n", format_location(source_manager, item.span.start()), text
	);
}

std::string
rsfuse::DialogResolutionProvider::show_usage(const PendingItem &pending) const {
	std::string message;
	for (auto &usage : pending.usages) {
		auto text = source_text(source_manager, usage.span);
		message += fmt::format(
			"\n{} in '{}'\n{}\n",
			format_location(source_manager, usage.span.start()),
			catalog.get(usage.item).identity,
			text
		);
	}
	if (message.empty()) {
		return fmt::format(
			"No usage of '{}' found in required items.\n",
			catalog.get(pending.item).name
		);
	}
	return message + "\n";
}

std::optional<fs::path> rsfuse::save_configuration_dialog(
	Dialog &dialog,
	const Configuration &config,
	const fs::path &default_path,
	bool verbose
) {
	auto input = dialog.text_input(
		"Enter file path to save the impl configuration.",
		"enter to accept, q to skip saving",
		default_path.string()
	);
	if (!input.has_value()) {
		if (verbose) {
			fmt::println(stderr, "Skipping saving impl configuration.");
		}
		return std::nullopt;
	}
	fs::path path(*input);
	if (fs::exists(path)) {
		auto overwrite = dialog.confirm(
			fmt::format(
				"Overwriting existing impl configuration '{}'?", path.string()
			),
			"Default is not overwriting (N).",
			false
		);
		if (!overwrite) {
			if (verbose) {
				fmt::println(
					stderr,
					"Skipping saving impl configuration to '{}'.",
					path.string()
				);
			}
			return std::nullopt;
		}
	}
	config.save(path);
	return path;
}
