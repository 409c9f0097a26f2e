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

#include <slang/text/SourceLocation.h>
#include <slang/text/SourceManager.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rsfuse {
	enum class ErrorKind {
		unsupported_item_kind = 0,
		duplicate_item_identity,
		ambiguous_impl_item_reference,
		operator_cancelled,
		invalid_config_pattern,
		input_error,
	};

	std::string_view to_string(ErrorKind kind);

	/**
	 * @brief Fatal error of a fusion run.
	 *
	 * Every stage throws this instead of returning partial results; the
	 * driver's caller is expected to terminate without emitting output.
	 */
	class FusionError : public std::runtime_error {
	public:
		FusionError(ErrorKind kind, const std::string &what);

		ErrorKind get_kind() const { return kind; }

	private:
		ErrorKind kind;
	};

	enum class Severity {
		note = 0,
		warning,
		error,
	};

	enum class DiagnosticKind {
		unresolved_trait_impl = 0,
		forced_inclusion,
		excluded_trait_impl,
		unknown_config_target,
		skipped_crate,
	};

	struct Diagnostic {
		Severity severity = Severity::note;
		DiagnosticKind kind = DiagnosticKind::forced_inclusion;
		std::string message;
		slang::SourceLocation location;
	};

	// Non-fatal findings, handed to the reporting layer at the end of a run.
	class Diagnostics {
	public:
		void add(
			Severity severity,
			DiagnosticKind kind,
			std::string message,
			slang::SourceLocation location = slang::SourceLocation::NoLocation
		);

		const std::vector<Diagnostic> &get_all() const { return diagnostics; }
		size_t count(DiagnosticKind kind) const;
		size_t count(Severity severity) const;
		bool empty() const { return diagnostics.empty(); }

		void report(
			const slang::SourceManager &source_manager, FILE *f = stderr
		) const;

	private:
		std::vector<Diagnostic> diagnostics;
	};

	std::string format_location(
		const slang::SourceManager &source_manager,
		slang::SourceLocation location
	);
} // namespace rsfuse
