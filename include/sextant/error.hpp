// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sextant {

enum class ErrorCode {
	// Document loading
	file_not_found = 1,
	unsupported_format,
	invalid_json,
	invalid_yaml,
	invalid_spec_type,
	missing_openapi_version,
	unsupported_openapi_version,
	missing_info,
	missing_info_title,
	missing_info_version,
	missing_paths,

	// References
	reference_not_found,
	circular_reference,
	invalid_reference_format,
	external_reference_failed,
	external_reference_timeout,
	domain_not_allowed,

	// Composition
	allof_merge_conflict,
	ambiguous_discriminator,
	empty_composition,
	recursion_limit,

	// Catalog
	cancelled,
	catalog_failed,
};

const std::error_category& sextant_category() noexcept;
std::error_code make_error_code(ErrorCode code) noexcept;

// Stable upper-case identifier, e.g. "REFERENCE_NOT_FOUND".
std::string_view error_code_name(ErrorCode code) noexcept;

// Default human-actionable hint for an error code.
std::string_view default_suggestion(ErrorCode code) noexcept;

// Base of every error raised by the resolution core.
class Error : public std::runtime_error {
public:
	Error(ErrorCode code, const std::string& message, std::string path = {}, std::string suggestion = {});

	ErrorCode kind() const noexcept { return _kind; }
	std::error_code code() const noexcept { return make_error_code(_kind); }

	// Slash path from the document root of the node that failed, empty if unknown.
	const std::string& path() const noexcept { return _path; }
	const std::string& suggestion() const noexcept { return _suggestion; }

	// Only the innermost frame knows the location; outer frames must not overwrite it.
	void set_path_if_empty(std::string_view path);

	// "message at path: /x/y [CODE]" followed by the suggestion on its own line.
	std::string formatted() const;

private:
	ErrorCode _kind;
	std::string _path;
	std::string _suggestion;
};

class ParseError : public Error {
public:
	ParseError(ErrorCode code, const std::string& message, std::string source = {});

	const std::string& source() const noexcept { return _source; }

private:
	std::string _source;
};

// The bytes parsed, but the root is not a usable OpenAPI 3.x document.
class DocumentValidationError final : public ParseError {
public:
	using ParseError::ParseError;
};

class ReferenceNotFoundError final : public Error {
public:
	ReferenceNotFoundError(std::string pointer, std::string segment);

	const std::string& pointer() const noexcept { return _pointer; }
	const std::string& segment() const noexcept { return _segment; }

private:
	std::string _pointer;
	std::string _segment;
};

class CircularReferenceError final : public Error {
public:
	explicit CircularReferenceError(std::vector<std::string> chain);

	// Pointers on the resolution path, ending with the pointer that closed the cycle.
	const std::vector<std::string>& chain() const noexcept { return _chain; }

private:
	std::vector<std::string> _chain;
};

class UnsupportedSchemaShapeError final : public Error {
public:
	explicit UnsupportedSchemaShapeError(const std::string& reason, ErrorCode code = ErrorCode::empty_composition);
};

class SchemaCompositionError final : public Error {
public:
	SchemaCompositionError(
		std::string composition, std::string reason, ErrorCode code = ErrorCode::allof_merge_conflict);

	// "allOf", "oneOf" or "anyOf".
	const std::string& composition() const noexcept { return _composition; }
	const std::string& reason() const noexcept { return _reason; }

private:
	std::string _composition;
	std::string _reason;
};

class ExternalReferenceError final : public Error {
public:
	ExternalReferenceError(std::string pointer,
		const std::string& message,
		std::exception_ptr cause = nullptr,
		ErrorCode code = ErrorCode::external_reference_failed);

	const std::string& pointer() const noexcept { return _pointer; }
	std::exception_ptr cause() const noexcept { return _cause; }

private:
	std::string _pointer;
	std::exception_ptr _cause;
};

class RecursionLimitExceededError final : public Error {
public:
	explicit RecursionLimitExceededError(std::size_t limit);

	std::size_t limit() const noexcept { return _limit; }

private:
	std::size_t _limit;
};

struct SchemaCatalog;

class CancelledError final : public Error {
public:
	explicit CancelledError(std::shared_ptr<const SchemaCatalog> partial);

	// Everything resolved before the stop request was observed.
	const std::shared_ptr<const SchemaCatalog>& partial() const noexcept { return _partial; }

private:
	std::shared_ptr<const SchemaCatalog> _partial;
};

// One failed top-level schema or operation.
struct SchemaFailure {
	std::string subject;
	std::string message;
	std::exception_ptr error;
};

class CatalogError final : public Error {
public:
	explicit CatalogError(std::vector<SchemaFailure> failures);

	const std::vector<SchemaFailure>& failures() const noexcept { return _failures; }

private:
	std::vector<SchemaFailure> _failures;
};

} // namespace sextant

namespace std {

template <>
struct is_error_code_enum<::sextant::ErrorCode> : public true_type {};

} // namespace std
