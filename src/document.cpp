// SPDX-License-Identifier: Apache-2.0
#include <sextant/document.hpp>
#include <sextant/error.hpp>
#include <sextant/log.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <simdjson.h>
#include <yaml-cpp/yaml.h>

#include "util.hpp"

namespace fs = std::filesystem;

namespace sextant {

namespace {

RawNode FromSimdjson(simdjson::dom::element element) {
	using simdjson::dom::element_type;
	switch (element.type()) {
	case element_type::ARRAY: {
		RawNode::Array arr;
		for (simdjson::dom::element child : element.get_array().value_unsafe()) {
			arr.push_back(FromSimdjson(child));
		}
		return RawNode(std::move(arr));
	}
	case element_type::OBJECT: {
		RawNode::Object obj;
		for (simdjson::dom::key_value_pair field : element.get_object().value_unsafe()) {
			obj.emplace_back(std::string(field.key), FromSimdjson(field.value));
		}
		return RawNode(std::move(obj));
	}
	case element_type::INT64:
		return RawNode(element.get_int64().value_unsafe());
	case element_type::UINT64:
		// Only values above INT64_MAX end up here.
		return RawNode(static_cast<double>(element.get_uint64().value_unsafe()));
	case element_type::DOUBLE:
		return RawNode(element.get_double().value_unsafe());
	case element_type::STRING:
		return RawNode(std::string(element.get_string().value_unsafe()));
	case element_type::BOOL:
		return RawNode(element.get_bool().value_unsafe());
	case element_type::NULL_VALUE:
		break;
	}
	return RawNode();
}

bool IsYamlNull(std::string_view s) noexcept { return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL"; }

std::optional<bool> YamlBool(std::string_view s) noexcept {
	if (s == "true" || s == "True" || s == "TRUE") {
		return true;
	}
	if (s == "false" || s == "False" || s == "FALSE") {
		return false;
	}
	return std::nullopt;
}

std::optional<std::int64_t> YamlInt(std::string_view s) noexcept {
	if (!s.empty() && s.front() == '+') {
		s.remove_prefix(1);
	}
	if (s.empty()) {
		return std::nullopt;
	}
	std::int64_t value = 0;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc() || ptr != s.data() + s.size()) {
		return std::nullopt;
	}
	return value;
}

std::optional<double> YamlFloat(std::string_view s) noexcept {
	if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf") {
		return std::numeric_limits<double>::infinity();
	}
	if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
		return -std::numeric_limits<double>::infinity();
	}
	if (!s.empty() && s.front() == '+') {
		s.remove_prefix(1);
	}
	// from_chars also accepts "inf" and "nan", which YAML treats as strings.
	if (s.empty() || !(std::isdigit(static_cast<unsigned char>(s.front())) || s.front() == '-' || s.front() == '.')) {
		return std::nullopt;
	}
	double value = 0;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc() || ptr != s.data() + s.size()) {
		return std::nullopt;
	}
	return value;
}

// Plain scalars follow the YAML 1.2 core schema, quoted or tagged ones stay strings.
RawNode YamlScalar(const YAML::Node& node) {
	const std::string& text = node.Scalar();
	if (node.Tag() != "?") {
		return RawNode(text);
	}
	if (IsYamlNull(text)) {
		return RawNode();
	}
	if (auto b = YamlBool(text)) {
		return RawNode(*b);
	}
	if (auto i = YamlInt(text)) {
		return RawNode(*i);
	}
	if (auto d = YamlFloat(text)) {
		return RawNode(*d);
	}
	return RawNode(text);
}

RawNode FromYaml(const YAML::Node& node) {
	switch (node.Type()) {
	case YAML::NodeType::Scalar:
		return YamlScalar(node);
	case YAML::NodeType::Sequence: {
		RawNode::Array arr;
		arr.reserve(node.size());
		for (const auto& child : node) {
			arr.push_back(FromYaml(child));
		}
		return RawNode(std::move(arr));
	}
	case YAML::NodeType::Map: {
		RawNode::Object obj;
		obj.reserve(node.size());
		for (const auto& kv : node) {
			obj.emplace_back(kv.first.Scalar(), FromYaml(kv.second));
		}
		return RawNode(std::move(obj));
	}
	case YAML::NodeType::Null:
	case YAML::NodeType::Undefined:
		break;
	}
	return RawNode();
}

void Require(bool condition, ErrorCode code, const std::string& message, const std::string& source) {
	if (!condition) {
		throw DocumentValidationError(code, message, source);
	}
}

} // namespace

DocumentPtr parse_document(std::string_view bytes, DocumentFormat format, std::string source) {
	auto doc = std::make_shared<Document>();
	doc->format = format;
	if (format == DocumentFormat::json) {
		simdjson::dom::parser parser;
		simdjson::padded_string padded(bytes.data(), bytes.size());
		simdjson::dom::element root;
		if (const auto error = parser.parse(padded).get(root); error) {
			throw ParseError(ErrorCode::invalid_json,
				fmt::format("Failed to parse JSON from {}: {}", source, simdjson::error_message(error)),
				source);
		}
		doc->root = FromSimdjson(root);
	} else {
		YAML::Node root;
		try {
			root = YAML::Load(std::string(bytes));
		} catch (const YAML::Exception& e) {
			throw ParseError(ErrorCode::invalid_yaml, fmt::format("Failed to parse YAML from {}: {}", source, e.what()), source);
		}
		doc->root = FromYaml(root);
	}
	doc->source = std::move(source);
	return doc;
}

std::optional<DocumentFormat> FormatFromExtension(const fs::path& path) {
	const auto ext = path.extension().string();
	if (compare_ignore_case(ext, ".json")) {
		return DocumentFormat::json;
	}
	if (compare_ignore_case(ext, ".yaml") || compare_ignore_case(ext, ".yml")) {
		return DocumentFormat::yaml;
	}
	return std::nullopt;
}

DocumentPtr load_document(const fs::path& path, bool validate) {
	if (!fs::exists(path) || !fs::is_regular_file(path)) {
		throw ParseError(ErrorCode::file_not_found, fmt::format("File not found: {}", path.string()), path.string());
	}
	const auto format = FormatFromExtension(path);
	if (!format) {
		throw ParseError(ErrorCode::unsupported_format,
			fmt::format("Unsupported file format: {}", path.extension().string()),
			path.string());
	}

	std::ifstream in(path, std::ios::binary);
	std::ostringstream buffer;
	buffer << in.rdbuf();
	if (!in && !in.eof()) {
		throw ParseError(ErrorCode::file_not_found, fmt::format("Failed to read {}", path.string()), path.string());
	}

	auto doc = parse_document(buffer.str(), *format, path.string());
	if (validate) {
		validate_document(*doc);
	}
	log(LogLevel::info, "Loaded {} (OpenAPI {})", path.string(), doc->root.string_or("openapi", "?"));
	return doc;
}

void validate_document(const Document& doc) {
	const auto& root = doc.root;
	Require(root.is_object(), ErrorCode::invalid_spec_type, "Invalid OpenAPI specification: not an object", doc.source);

	const auto* openapi = root.find("openapi");
	Require(openapi != nullptr && openapi->is_string(),
		ErrorCode::missing_openapi_version,
		"Missing required field: openapi",
		doc.source);
	if (!openapi->as_string().starts_with("3.")) {
		throw DocumentValidationError(ErrorCode::unsupported_openapi_version,
			fmt::format("Unsupported OpenAPI version: {}. Only 3.x is supported.", openapi->as_string()),
			doc.source);
	}

	const auto* info = root.find("info");
	Require(info != nullptr && info->is_object(), ErrorCode::missing_info, "Missing required field: info", doc.source);
	Require(!info->string_or("title").empty(),
		ErrorCode::missing_info_title,
		"Missing required field: info.title",
		doc.source);
	Require(!info->string_or("version").empty(),
		ErrorCode::missing_info_version,
		"Missing required field: info.version",
		doc.source);

	Require(root.contains("paths"), ErrorCode::missing_paths, "Missing required field: paths", doc.source);
}

} // namespace sextant
