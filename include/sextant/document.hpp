// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "raw_node.hpp"

namespace sextant {

enum class DocumentFormat : uint8_t { json, yaml };

// One parsed OpenAPI document. Read-only once loaded; resolved schemas point into it
// only while resolution runs, so the document must outlive the resolution, not the catalog.
struct Document {
	RawNode root;
	// File path or caller supplied label. Identifies the document in cache keys and
	// is the base for relative external references.
	std::string source;
	DocumentFormat format = DocumentFormat::json;
};

using DocumentPtr = std::shared_ptr<const Document>;

// Parses JSON (simdjson) or YAML (yaml-cpp) bytes. Throws ParseError.
DocumentPtr parse_document(std::string_view bytes, DocumentFormat format, std::string source = "<memory>");

// Reads and parses a file, choosing the format from its extension.
// Throws ParseError, or DocumentValidationError when `validate` is set and the root is not OpenAPI 3.x.
DocumentPtr load_document(const std::filesystem::path& path, bool validate = true);

// ".json" -> json, ".yaml"/".yml" -> yaml, anything else -> nullopt.
std::optional<DocumentFormat> FormatFromExtension(const std::filesystem::path& path);

// Checks the fields every OpenAPI 3.x root must carry. Throws DocumentValidationError.
void validate_document(const Document& doc);

} // namespace sextant
