// SPDX-License-Identifier: Apache-2.0
#include <sextant/error.hpp>

#include <fmt/format.h>

namespace sextant {

namespace {

class sextant_error_category final : public std::error_category {
public:
	const char* name() const noexcept override { return "sextant"; }
	std::string message(int ev) const override { return std::string(error_code_name(static_cast<ErrorCode>(ev))); }
};

std::string join_chain(const std::vector<std::string>& chain) {
	std::string out;
	for (const auto& pointer : chain) {
		if (!out.empty()) {
			out += " -> ";
		}
		out += pointer;
	}
	return out;
}

std::string summarize(const std::vector<SchemaFailure>& failures) {
	std::string out = fmt::format("{} schema(s) failed to resolve", failures.size());
	for (const auto& failure : failures) {
		out += fmt::format("\n  {}: {}", failure.subject, failure.message);
	}
	return out;
}

} // namespace

const std::error_category& sextant_category() noexcept {
	static const sextant_error_category instance;
	return instance;
}

std::error_code make_error_code(ErrorCode code) noexcept {
	return std::error_code(static_cast<int>(code), sextant_category());
}

std::string_view error_code_name(ErrorCode code) noexcept {
	switch (code) {
	case ErrorCode::file_not_found:
		return "FILE_NOT_FOUND";
	case ErrorCode::unsupported_format:
		return "UNSUPPORTED_FORMAT";
	case ErrorCode::invalid_json:
		return "INVALID_JSON";
	case ErrorCode::invalid_yaml:
		return "INVALID_YAML";
	case ErrorCode::invalid_spec_type:
		return "INVALID_SPEC_TYPE";
	case ErrorCode::missing_openapi_version:
		return "MISSING_OPENAPI_VERSION";
	case ErrorCode::unsupported_openapi_version:
		return "UNSUPPORTED_OPENAPI_VERSION";
	case ErrorCode::missing_info:
		return "MISSING_INFO";
	case ErrorCode::missing_info_title:
		return "MISSING_INFO_TITLE";
	case ErrorCode::missing_info_version:
		return "MISSING_INFO_VERSION";
	case ErrorCode::missing_paths:
		return "MISSING_PATHS";
	case ErrorCode::reference_not_found:
		return "REFERENCE_NOT_FOUND";
	case ErrorCode::circular_reference:
		return "CIRCULAR_REFERENCE";
	case ErrorCode::invalid_reference_format:
		return "INVALID_REFERENCE_FORMAT";
	case ErrorCode::external_reference_failed:
		return "EXTERNAL_REFERENCE_FAILED";
	case ErrorCode::external_reference_timeout:
		return "EXTERNAL_REFERENCE_TIMEOUT";
	case ErrorCode::domain_not_allowed:
		return "DOMAIN_NOT_ALLOWED";
	case ErrorCode::allof_merge_conflict:
		return "ALLOF_MERGE_CONFLICT";
	case ErrorCode::ambiguous_discriminator:
		return "AMBIGUOUS_DISCRIMINATOR";
	case ErrorCode::empty_composition:
		return "EMPTY_COMPOSITION";
	case ErrorCode::recursion_limit:
		return "RECURSION_LIMIT";
	case ErrorCode::cancelled:
		return "CANCELLED";
	case ErrorCode::catalog_failed:
		return "CATALOG_FAILED";
	}
	return "UNKNOWN";
}

std::string_view default_suggestion(ErrorCode code) noexcept {
	switch (code) {
	case ErrorCode::file_not_found:
		return "Verify the file path exists and you have read permissions";
	case ErrorCode::unsupported_format:
		return "Use .json, .yaml, or .yml file extensions for OpenAPI specifications";
	case ErrorCode::invalid_json:
		return "Check JSON syntax and ensure valid JSON format";
	case ErrorCode::invalid_yaml:
		return "Check YAML syntax and ensure valid YAML format";
	case ErrorCode::invalid_spec_type:
		return "Ensure the root of the file is a valid JSON/YAML object";
	case ErrorCode::missing_openapi_version:
		return "Add an \"openapi\" field specifying the OpenAPI version (e.g., \"3.0.3\")";
	case ErrorCode::unsupported_openapi_version:
		return "Update to OpenAPI 3.x format (3.0.x or 3.1.x)";
	case ErrorCode::missing_info:
		return "Add an \"info\" object with \"title\" and \"version\" properties";
	case ErrorCode::missing_info_title:
		return "Add a \"title\" field to the info object";
	case ErrorCode::missing_info_version:
		return "Add a \"version\" field to the info object";
	case ErrorCode::missing_paths:
		return "Add a \"paths\" object defining API endpoints";
	case ErrorCode::reference_not_found:
		return "Ensure the referenced component exists in the components section";
	case ErrorCode::circular_reference:
		return "Break the cycle: a schema may only refer to itself through a property, array item or variant";
	case ErrorCode::invalid_reference_format:
		return "Use format: \"file.yaml#/path/to/schema\" for external references";
	case ErrorCode::external_reference_failed:
		return "Verify the external document exists and contains a valid OpenAPI specification";
	case ErrorCode::external_reference_timeout:
		return "Check that the external document is reachable or raise the external reference timeout";
	case ErrorCode::domain_not_allowed:
		return "Add the domain to the allowed domains of the external resolver";
	case ErrorCode::allof_merge_conflict:
		return "Resolve conflicting properties in allOf schemas";
	case ErrorCode::ambiguous_discriminator:
		return "Add an explicit discriminator mapping so every value selects exactly one variant";
	case ErrorCode::empty_composition:
		return "Ensure oneOf/anyOf contains at least one schema variant";
	case ErrorCode::recursion_limit:
		return "Flatten the schema nesting or raise the maximum resolution depth";
	case ErrorCode::cancelled:
		return "";
	case ErrorCode::catalog_failed:
		return "Fix the listed schemas and run again";
	}
	return "";
}

Error::Error(ErrorCode code, const std::string& message, std::string path, std::string suggestion)
	: std::runtime_error(message)
	, _kind(code)
	, _path(std::move(path))
	, _suggestion(suggestion.empty() ? std::string(default_suggestion(code)) : std::move(suggestion)) {}

void Error::set_path_if_empty(std::string_view path) {
	if (_path.empty()) {
		_path = path;
	}
}

std::string Error::formatted() const {
	std::string out = what();
	if (!_path.empty()) {
		out += fmt::format(" at path: {}", _path);
	}
	out += fmt::format(" [{}]", error_code_name(_kind));
	if (!_suggestion.empty()) {
		out += fmt::format("\nSuggestion: {}", _suggestion);
	}
	return out;
}

ParseError::ParseError(ErrorCode code, const std::string& message, std::string source)
	: Error(code, message)
	, _source(std::move(source)) {}

ReferenceNotFoundError::ReferenceNotFoundError(std::string pointer, std::string segment)
	: Error(ErrorCode::reference_not_found,
		  fmt::format("Reference not found: {} (no member '{}')", pointer, segment))
	, _pointer(std::move(pointer))
	, _segment(std::move(segment)) {}

CircularReferenceError::CircularReferenceError(std::vector<std::string> chain)
	: Error(ErrorCode::circular_reference, fmt::format("Circular reference detected: {}", join_chain(chain)))
	, _chain(std::move(chain)) {}

UnsupportedSchemaShapeError::UnsupportedSchemaShapeError(const std::string& reason, ErrorCode code)
	: Error(code, fmt::format("Unsupported schema shape: {}", reason)) {}

SchemaCompositionError::SchemaCompositionError(std::string composition, std::string reason, ErrorCode code)
	: Error(code, fmt::format("Cannot compose {}: {}", composition, reason))
	, _composition(std::move(composition))
	, _reason(std::move(reason)) {}

ExternalReferenceError::ExternalReferenceError(
	std::string pointer, const std::string& message, std::exception_ptr cause, ErrorCode code)
	: Error(code, fmt::format("External reference {} failed: {}", pointer, message))
	, _pointer(std::move(pointer))
	, _cause(std::move(cause)) {}

RecursionLimitExceededError::RecursionLimitExceededError(std::size_t limit)
	: Error(ErrorCode::recursion_limit, fmt::format("Schema nesting exceeds the maximum depth of {}", limit))
	, _limit(limit) {}

CancelledError::CancelledError(std::shared_ptr<const SchemaCatalog> partial)
	: Error(ErrorCode::cancelled, "Catalog construction was cancelled")
	, _partial(std::move(partial)) {}

CatalogError::CatalogError(std::vector<SchemaFailure> failures)
	: Error(ErrorCode::catalog_failed, summarize(failures))
	, _failures(std::move(failures)) {}

} // namespace sextant
