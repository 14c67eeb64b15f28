// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace sextant {

bool compare_ignore_case(std::string_view l, std::string_view r) noexcept;

// Modifies a string to produce words that can be used as identifiers in generated code.
// This includes replacing punctuation with underscores, editing names that begin with a number,
// and modifying names that are C++ keywords.
void sanitize(std::string& input);
std::string sanitize(std::string_view input);

} // namespace sextant
