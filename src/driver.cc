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

#include "driver.hh"
#include "assembler.hh"
#include "crate_dump.hh"
#include "dialog.hh"
#include "fusion.hh"

#include <slang/util/OS.h>

#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <picosha2.h>

#include <fstream>
#include <iostream>

using namespace slang;
namespace fs = std::filesystem;

static std::optional<std::string> hash_file(fs::path path) {
	std::ifstream f(path, std::ios::binary);
	if (!f) {
		return std::nullopt;
	}
	std::string current_hash;
	picosha2::hash256_hex_string(
		std::istreambuf_iterator<char>(f),
		std::istreambuf_iterator<char>(),
		current_hash
	);
	f.close();
	return current_hash;
}

extern const char VERSION[];

static constexpr int cache_version = 1;
static constexpr const char *default_config_path = "rsfuse_config.toml";

rsfuse::Driver::Driver() {
	cmdLine.add("-h,--help", show_help, "Display available options");
	cmdLine.add(
		"--version", show_version, "Display version information and exit"
	);
	cmdLine.add(
		"--input",
		input,
		"The crate dump (JSON) of the binary crate and its library crates",
		"<file>"
	);
	cmdLine.add(
		"--config",
		config_file,
		"Impl item and impl block configuration (TOML)",
		"<file>"
	);
	cmdLine.add(
		"--entry",
		entry,
		"Name of the entry function of the binary crate (default: main)",
		"<name>"
	);
	cmdLine.add(
		"--include-impl-item",
		include_impl_items,
		"Fuse this impl item: name, name@<impl block> or *@<impl block>",
		"<pattern>"
	);
	cmdLine.add(
		"--exclude-impl-item",
		exclude_impl_items,
		"Do not fuse this impl item unless it is required structurally",
		"<pattern>"
	);
	cmdLine.add(
		"--include-impl-block",
		include_impl_blocks,
		"Fuse this impl block, given by its fully qualified name",
		"<impl block>"
	);
	cmdLine.add(
		"--exclude-impl-block",
		exclude_impl_blocks,
		"Do not fuse this impl block unless it is required structurally",
		"<impl block>"
	);
	cmdLine.add(
		"--process-all-impl-items",
		process_all_impl_items,
		"Decide all ambiguous impl items without configuration entry "
		"(include|exclude)",
		"<include|exclude>"
	);
	cmdLine.add(
		"--batch",
		batch,
		"Never ask: impl items without a decision are a fatal error"
	);
	cmdLine.add("--output", output, "The file to write the fused source to");
	cmdLine.add(
		"--cache-to",
		cache_file,
		"Optional- if specified, the file in question is used to store caching "
		"information. The directory it lies in must exist."
	);
	cmdLine.add("-v,--verbose", verbose, "Log every resolution decision");
	cmdLine.add(
		"--dump-graph",
		dump_graph,
		"Print every catalog item with its references and edges to stderr"
	);
}

void rsfuse::Driver::parse_cli(int argc, char *argv[]) {
	if (!cmdLine.parse(argc, argv)) {
		std::string what = "";
		for (auto &err : cmdLine.getErrors()) {
			what = what + err + "\n";
		}
		throw std::runtime_error(what);
	}
	if (show_help == true) {
		OS::print(fmt::format("{}", cmdLine.getHelpText("rsfuse")));
		exit(0);
	}
	if (show_version == true) {
		OS::print(fmt::format("rsfuse {}\n", (const char *)VERSION));
		exit(0);
	}
	if (!input.has_value()) {
		throw std::runtime_error("A crate dump must be provided. (--input …)");
	}
	if (process_all_impl_items.has_value()) {
		if (*process_all_impl_items == "include") {
			policy_options.impl_items_default = Decision::include;
		} else if (*process_all_impl_items == "exclude") {
			policy_options.impl_items_default = Decision::exclude;
		} else {
			throw std::runtime_error(fmt::format(
				"--process-all-impl-items expects 'include' or 'exclude', got "
				"'{}'.",
				*process_all_impl_items
			));
		}
	}
	policy_options.verbose = verbose == true;
}

rsfuse::Configuration rsfuse::Driver::get_cli_config() const {
	Configuration cli;
	cli.impl_items.include = include_impl_items;
	cli.impl_items.exclude = exclude_impl_items;
	cli.impl_blocks.include = include_impl_blocks;
	cli.impl_blocks.exclude = exclude_impl_blocks;
	return cli;
}

nlohmann::json rsfuse::Driver::get_options_fingerprint() const {
	return nlohmann::json{
		{"entry", entry.value_or("main")},
		{"cli_config", get_cli_config().to_json()},
		{"process_all_impl_items", process_all_impl_items.value_or("")},
		{"batch", batch == true},
	};
}

bool rsfuse::Driver::load_cache() {
	fs::path cache_path(*cache_file);
	std::ifstream cache_reader;
	cache_reader.open(cache_path);
	// If we fail to open the file, that's a cache miss:
	if (!cache_reader) {
		fmt::println(stderr, "Cache file not found. Fusing…");
		return false;
	}

	nlohmann::json j;
	try {
		cache_reader >> j;
	} catch (nlohmann::json::exception &) {
		fmt::println(stderr, "Cache file is unreadable. Fusing…");
		return false;
	}
	cache_reader.close();

	if (j["meta"]["rsfuse_cache_version"] != cache_version) {
		fmt::println(
			stderr,
			"Cache is incompatible with current version of rsfuse. Fusing "
			"anew…"
		);
		return false;
	}

	std::set<fs::path> cache_loaded_files;
	for (auto &file : j["input_file_list"]) {
		cache_loaded_files.insert(fs::path(file.get<std::string>()));
	}

	// If the inputs or options differ, that is also a cache miss:
	if (input_file_list != cache_loaded_files ||
		j["options"] != get_options_fingerprint()) {
		fmt::println(
			stderr,
			"Inputs are different between current invocation and cache. "
			"Fusing…"
		);
		return false;
	}

	// Time to compare the hashes.
	auto file_hashes = j["file_hashes"];
	for (auto it = file_hashes.begin(); it != file_hashes.end(); it++) {
		auto path = fs::path(it.key());
		auto cached_hash = it.value().get<std::string>();
		auto current_hash = hash_file(path);
		if (current_hash != cached_hash) {
			fmt::println(stderr, "File {} changed, re-running fusion…", path.string());
			return false;
		}
	}
	fmt::println(stderr, "Input files have not changed, loading from cache…");
	result = j["result"].get<std::string>();
	return true;
}

void rsfuse::Driver::prepare() {
	input_file_list.insert(fs::absolute(*input));
	if (config_file.has_value()) {
		input_file_list.insert(fs::absolute(*config_file));
	}
	if (cache_file.has_value() && load_cache()) {
		cached = true;
		return;
	}

	if (config_file.has_value()) {
		file_config = Configuration::load(*config_file);
	}
	config = file_config;
	config.merge(get_cli_config());

	CrateDumpLoader loader(source_manager);
	crates = loader.load(*input);
	catalog = std::make_unique<Catalog>(Catalog::build(crates));
	for (auto &label : catalog->skipped_crates) {
		diagnostics.add(
			Severity::note,
			DiagnosticKind::skipped_crate,
			fmt::format("Crate '{}' is listed more than once; skipped.", label)
		);
	}
	source_file_list = loader.get_source_files();
	if (policy_options.verbose) {
		fmt::println(
			stderr,
			"Catalogued {} items of {} crates.",
			catalog->size(),
			crates.size() - catalog->skipped_crates.size()
		);
	}
}

void rsfuse::Driver::analyze() {
	if (result.has_value()) {
		return;
	}

	FusionOptions options;
	options.entry = entry.value_or("main");
	options.policy = policy_options;
	Fusion fusion(*catalog, config, options, diagnostics);
	if (dump_graph == true) {
		fusion.get_graph().output(*catalog, stderr);
	}

	ConsoleDialog dialog(std::cin, stderr);
	DialogResolutionProvider dialog_provider(*catalog, source_manager, dialog);
	BatchResolutionProvider batch_provider(*catalog);
	try {
		if (batch == true) {
			fusion.run(batch_provider);
		} else {
			fusion.run(dialog_provider);
		}
	} catch (FusionError &) {
		// report what was collected before the failure
		diagnostics.report(source_manager, stderr);
		throw;
	}

	Emitter emitter(*catalog, fusion.get_graph(), source_manager);
	auto fused = fusion.get_result();
	result = emitter.emit(fused);
	if (policy_options.verbose) {
		fmt::println(
			stderr, "Fused {} of {} items.", fused.size(), catalog->size()
		);
	}

	if (dialog_provider.got_user_input()) {
		// Operator answers can only be replayed from the --config file.
		cacheable = false;
	}
	if (dialog_provider.got_user_input() && !fusion.get_decisions().empty()) {
		auto to_save = file_config;
		to_save.merge(fusion.get_decisions());
		auto saved = save_configuration_dialog(
			dialog,
			to_save,
			config_file.value_or(default_config_path),
			policy_options.verbose
		);
		if (saved.has_value() && config_file.has_value() &&
			fs::absolute(*saved) == fs::absolute(*config_file)) {
			cacheable = true;
		}
	}
	diagnostics.report(source_manager, stderr);
}

void rsfuse::Driver::write_output() const {
	if (!result.has_value()) {
		return;
	}
	if (output.has_value()) {
		OS::writeFile(*output, *result);
	} else {
		OS::print(*result);
	}
}

void rsfuse::Driver::try_write_cache() const {
	if (!cache_file.has_value() || !result.has_value() || cached) {
		return;
	}
	if (!cacheable) {
		fmt::println(
			stderr,
			"Operator decisions were not saved to the configuration, not "
			"writing cache."
		);
		return;
	}
	fs::path cache_path{*cache_file};
	nlohmann::json file_hashes = nlohmann::json::object();
	for (auto &files : {input_file_list, source_file_list}) {
		for (auto &path : files) {
			auto current_hash = hash_file(path);
			if (!current_hash.has_value()) {
				fmt::println(
					stderr, "Cannot hash {}, not writing cache.", path.string()
				);
				return;
			}
			file_hashes[path.string()] = *current_hash;
		}
	}
	nlohmann::json meta;
	meta["rsfuse_cache_version"] = cache_version;

	std::vector<std::string> input_files;
	for (auto &path : input_file_list) {
		input_files.push_back(path.string());
	}

	nlohmann::json rsfuse_cache_info{
		{"meta", meta},
		{"input_file_list", input_files},
		{"options", get_options_fingerprint()},
		{"file_hashes", file_hashes},
		{"result", *result},
	};

	std::ofstream writer(cache_path);
	writer << rsfuse_cache_info;
	writer.close();
}
