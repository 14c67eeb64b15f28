// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <sextant/document.hpp>

namespace sextant::test {

inline DocumentPtr Yaml(std::string_view text, std::string source = "<test>") {
	return parse_document(text, DocumentFormat::yaml, std::move(source));
}

inline DocumentPtr Json(std::string_view text, std::string source = "<test>") {
	return parse_document(text, DocumentFormat::json, std::move(source));
}

inline std::string DataPath(std::string_view name) { return std::string(SEXTANT_TEST_DATA) + "/" + std::string(name); }

} // namespace sextant::test
