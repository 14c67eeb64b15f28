// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace sextant {

// Decodes one pointer token: URI percent escapes first, then "~1" -> '/' and "~0" -> '~'.
inline std::string decode_pointer_token(std::string_view token) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9')
			return c - '0';
		if (c >= 'a' && c <= 'f')
			return c - 'a' + 10;
		if (c >= 'A' && c <= 'F')
			return c - 'A' + 10;
		return -1;
	};

	std::string unescaped;
	unescaped.reserve(token.size());
	for (size_t i = 0; i < token.size(); ++i) {
		if (token[i] == '%' && i + 2 < token.size() && hex(token[i + 1]) >= 0 && hex(token[i + 2]) >= 0) {
			unescaped.push_back(static_cast<char>(hex(token[i + 1]) * 16 + hex(token[i + 2])));
			i += 2;
		} else {
			unescaped.push_back(token[i]);
		}
	}

	std::string out;
	out.reserve(unescaped.size());
	for (size_t i = 0; i < unescaped.size(); ++i) {
		if (unescaped[i] == '~' && i + 1 < unescaped.size() && (unescaped[i + 1] == '0' || unescaped[i + 1] == '1')) {
			out.push_back(unescaped[i + 1] == '0' ? '~' : '/');
			++i;
		} else {
			out.push_back(unescaped[i]);
		}
	}
	return out;
}

inline std::string encode_pointer_token(std::string_view token) {
	std::string out;
	out.reserve(token.size());
	for (const char c : token) {
		if (c == '~') {
			out += "~0";
		} else if (c == '/') {
			out += "~1";
		} else {
			out.push_back(c);
		}
	}
	return out;
}

// A JSON pointer ("/components/schemas/Foo") split into decoded tokens.
class JsonPointer {
public:
	using string_view_type = std::string_view;
	using size_type = string_view_type::size_type;

	JsonPointer() = default;

	// Accepts "" (whole document) or a string starting with '/'.
	explicit JsonPointer(string_view_type sv) {
		if (sv.empty()) {
			return;
		}
		if (sv.front() == '/') {
			sv.remove_prefix(1);
		}
		size_type pos = 0;
		do {
			pos = sv.find_first_of('/');
			_tokens.push_back(decode_pointer_token(sv.substr(0, pos)));
			if (pos == string_view_type::npos) {
				break;
			}
			sv.remove_prefix(pos + 1);
		} while (true);
	}

	const std::vector<std::string>& tokens() const noexcept { return _tokens; }
	bool empty() const noexcept { return _tokens.empty(); }
	size_type size() const noexcept { return _tokens.size(); }

	// Canonical encoding, e.g. "/components/schemas/Foo".
	std::string str() const {
		std::string out;
		for (const auto& token : _tokens) {
			out.push_back('/');
			out += encode_pointer_token(token);
		}
		return out;
	}

	// Last token, which names the target for "#/components/schemas/<name>" pointers.
	std::string_view back() const noexcept {
		return _tokens.empty() ? std::string_view() : std::string_view(_tokens.back());
	}

private:
	std::vector<std::string> _tokens;
};

} // namespace sextant
