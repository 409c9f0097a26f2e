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

#include "config.hh"
#include "errors.hh"

#include <slang/util/OS.h>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace rsfuse;
namespace fs = std::filesystem;

static void merge_list(
	std::vector<std::string> &target, const std::vector<std::string> &source
) {
	for (auto &entry : source) {
		if (std::find(target.begin(), target.end(), entry) == target.end()) {
			target.push_back(entry);
		}
	}
}

static void normalize_list(std::vector<std::string> &list) {
	std::sort(list.begin(), list.end());
	list.erase(std::unique(list.begin(), list.end()), list.end());
}

static RuleSet rule_set_from_toml(const toml::table &table, const char *section) {
	RuleSet rules;
	auto node = table.get(section);
	if (node == nullptr) {
		return rules;
	}
	auto object = node->as_table();
	if (object == nullptr) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Configuration section '[{}]' is not a table.", section)
		);
	}
	auto read = [&](const char *key, std::vector<std::string> &list) {
		auto entries_node = object->get(key);
		if (entries_node == nullptr) {
			return;
		}
		auto entries = entries_node->as_array();
		if (entries == nullptr) {
			throw FusionError(
				ErrorKind::input_error,
				fmt::format("'{}.{}' is not an array.", section, key)
			);
		}
		for (auto &entry : *entries) {
			auto value = entry.value<std::string>();
			if (!entry.is_string() || !value.has_value()) {
				throw FusionError(
					ErrorKind::input_error,
					fmt::format("'{}.{}' contains a non-string.", section, key)
				);
			}
			list.push_back(std::move(*value));
		}
	};
	read("include", rules.include);
	read("exclude", rules.exclude);
	return rules;
}

static toml::table rule_set_to_toml(const RuleSet &rules) {
	toml::array include;
	for (auto &entry : rules.include) {
		include.push_back(entry);
	}
	toml::array exclude;
	for (auto &entry : rules.exclude) {
		exclude.push_back(entry);
	}
	return toml::table{
		{"include", std::move(include)},
		{"exclude", std::move(exclude)},
	};
}

void rsfuse::Configuration::merge(const Configuration &other) {
	merge_list(impl_items.include, other.impl_items.include);
	merge_list(impl_items.exclude, other.impl_items.exclude);
	merge_list(impl_blocks.include, other.impl_blocks.include);
	merge_list(impl_blocks.exclude, other.impl_blocks.exclude);
}

void rsfuse::Configuration::normalize() {
	normalize_list(impl_items.include);
	normalize_list(impl_items.exclude);
	normalize_list(impl_blocks.include);
	normalize_list(impl_blocks.exclude);
}

Configuration rsfuse::Configuration::from_toml(const toml::table &table) {
	Configuration config;
	config.impl_items = rule_set_from_toml(table, "impl_items");
	config.impl_blocks = rule_set_from_toml(table, "impl_blocks");
	return config;
}

toml::table rsfuse::Configuration::to_toml() const {
	return toml::table{
		{"impl_items", rule_set_to_toml(impl_items)},
		{"impl_blocks", rule_set_to_toml(impl_blocks)},
	};
}

Configuration
rsfuse::Configuration::parse(std::string_view text, std::string_view source) {
	toml::table table;
	try {
		table = toml::parse(text, source);
	} catch (toml::parse_error &e) {
		auto &begin = e.source().begin;
		throw FusionError(
			ErrorKind::input_error,
			fmt::format(
				"Could not parse configuration '{}' ({}:{}): {}",
				source,
				begin.line,
				begin.column,
				e.description()
			)
		);
	}
	return from_toml(table);
}

nlohmann::json rsfuse::Configuration::to_json() const {
	return nlohmann::json{
		{"impl_items",
		 {{"include", impl_items.include}, {"exclude", impl_items.exclude}}},
		{"impl_blocks",
		 {{"include", impl_blocks.include}, {"exclude", impl_blocks.exclude}}},
	};
}

Configuration rsfuse::Configuration::load(const fs::path &path) {
	std::ifstream reader(path);
	if (!reader) {
		throw FusionError(
			ErrorKind::input_error,
			fmt::format("Could not open configuration '{}'.", path.string())
		);
	}
	std::stringstream buffer;
	buffer << reader.rdbuf();
	return parse(buffer.str(), path.string());
}

void rsfuse::Configuration::save(const fs::path &path) const {
	auto normalized = *this;
	normalized.normalize();
	std::stringstream out;
	out << normalized.to_toml() << "\n";
	slang::OS::writeFile(path, out.str());
}
