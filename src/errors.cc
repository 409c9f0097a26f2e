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

#include "errors.hh"

#include <fmt/format.h>

#include <algorithm>

std::string_view rsfuse::to_string(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::unsupported_item_kind:
		return "UnsupportedItemKind";
	case ErrorKind::duplicate_item_identity:
		return "DuplicateItemIdentity";
	case ErrorKind::ambiguous_impl_item_reference:
		return "AmbiguousImplItemReference";
	case ErrorKind::operator_cancelled:
		return "OperatorCancelled";
	case ErrorKind::invalid_config_pattern:
		return "InvalidConfigPattern";
	case ErrorKind::input_error:
		return "InputError";
	}
	return "Unknown";
}

rsfuse::FusionError::FusionError(ErrorKind kind, const std::string &what)
	: std::runtime_error(fmt::format("{}: {}", to_string(kind), what)),
	  kind(kind) {}

void rsfuse::Diagnostics::add(
	Severity severity,
	DiagnosticKind kind,
	std::string message,
	slang::SourceLocation location
) {
	diagnostics.push_back({severity, kind, std::move(message), location});
}

size_t rsfuse::Diagnostics::count(DiagnosticKind kind) const {
	return std::count_if(
		diagnostics.begin(),
		diagnostics.end(),
		[kind](const Diagnostic &d) { return d.kind == kind; }
	);
}

size_t rsfuse::Diagnostics::count(Severity severity) const {
	return std::count_if(
		diagnostics.begin(),
		diagnostics.end(),
		[severity](const Diagnostic &d) { return d.severity == severity; }
	);
}

std::string rsfuse::format_location(
	const slang::SourceManager &source_manager, slang::SourceLocation location
) {
	if (location == slang::SourceLocation::NoLocation ||
		!location.buffer().valid()) {
		return "";
	}
	return fmt::format(
		"{}:{}:{}",
		source_manager.getFullPath(location.buffer()).string(),
		source_manager.getLineNumber(location),
		source_manager.getColumnNumber(location)
	);
}

void rsfuse::Diagnostics::report(
	const slang::SourceManager &source_manager, FILE *f
) const {
	for (auto &diagnostic : diagnostics) {
		std::string_view severity = "note";
		if (diagnostic.severity == Severity::warning) {
			severity = "warning";
		} else if (diagnostic.severity == Severity::error) {
			severity = "error";
		}
		auto location = format_location(source_manager, diagnostic.location);
		if (location.empty()) {
			fmt::println(f, "{}: {}", severity, diagnostic.message);
		} else {
			fmt::println(
				f, "{}: {}: {}", severity, location, diagnostic.message
			);
		}
	}
	fflush(f);
}
