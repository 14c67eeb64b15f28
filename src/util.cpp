// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "util.hpp"

using namespace std::literals;

namespace sextant {

bool compare_ignore_case(std::string_view l, std::string_view r) noexcept {
	if (l.size() == r.size()) {
		return std::equal(l.begin(), l.end(), r.begin(), r.end(), [](char a, char b) -> bool {
			return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
		});
	}
	return false;
}

void sanitize(std::string& input) {
	// Replace characters with underscore.
	std::replace_if(
		input.begin(),
		input.end(),
		[](char c) -> bool {
			constexpr auto chars = std::array{'/', '-', '.', ':', '+', ' ', '(', ')', '@', '{', '}'};
			return std::any_of(chars.begin(), chars.end(), [c](char d) { return c == d; });
		},
		'_');

	// Reserved keywords in C++.
	constexpr auto reserved = std::array{
		"operator"sv,
		"long"sv,
		"short"sv,
		"public"sv,
		"protected"sv,
		"private"sv,
		"default"sv,
		"delete"sv,
		"namespace"sv,
	};
	if (std::any_of(reserved.begin(), reserved.end(), [&input](const std::string_view& kw) { return input == kw; })) {
		input.push_back('_');
	}

	// Names cannot start with a number.
	if (!input.empty() && std::isdigit(static_cast<unsigned char>(input[0]))) {
		input.insert(0, 1, '_');
	}
}

std::string sanitize(std::string_view input) {
	std::string ret(input);
	sanitize(ret);
	return ret;
}

} // namespace sextant
