// SPDX-License-Identifier: Apache-2.0
#include <sextant/raw_node.hpp>

#include <cmath>
#include <iterator>

#include <fmt/format.h>

namespace sextant {

namespace {

void dump_string(std::string& out, std::string_view s) {
	out.push_back('"');
	for (const char c : s) {
		switch (c) {
		case '"':
			out += "\\\"";
			break;
		case '\\':
			out += "\\\\";
			break;
		case '\n':
			out += "\\n";
			break;
		case '\r':
			out += "\\r";
			break;
		case '\t':
			out += "\\t";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
			} else {
				out.push_back(c);
			}
		}
	}
	out.push_back('"');
}

} // namespace

double RawNode::as_number() const {
	if (is_integer()) {
		return static_cast<double>(as_integer());
	}
	return std::get<double>(_value);
}

const RawNode* RawNode::find(std::string_view key) const noexcept {
	const auto* obj = std::get_if<Object>(&_value);
	if (obj == nullptr) {
		return nullptr;
	}
	for (const auto& [k, v] : *obj) {
		if (k == key) {
			return &v;
		}
	}
	return nullptr;
}

std::string_view RawNode::string_or(std::string_view key, std::string_view fallback) const noexcept {
	const auto* node = find(key);
	return (node != nullptr && node->is_string()) ? std::string_view(node->as_string()) : fallback;
}

bool RawNode::bool_or(std::string_view key, bool fallback) const noexcept {
	const auto* node = find(key);
	return (node != nullptr && node->is_bool()) ? node->as_bool() : fallback;
}

RawNode& RawNode::emplace(std::string key, RawNode value) {
	if (is_null()) {
		_value = Object{};
	}
	auto& obj = as_object();
	obj.emplace_back(std::move(key), std::move(value));
	return obj.back().second;
}

std::string RawNode::dump() const {
	std::string out;
	dump(out);
	return out;
}

void RawNode::dump(std::string& out) const {
	struct Visitor {
		std::string& out;

		void operator()(Null) const { out += "null"; }
		void operator()(bool b) const { out += b ? "true" : "false"; }
		void operator()(std::int64_t i) const { fmt::format_to(std::back_inserter(out), "{}", i); }
		void operator()(double d) const {
			if (std::isfinite(d)) {
				fmt::format_to(std::back_inserter(out), "{}", d);
			} else {
				out += "null";
			}
		}
		void operator()(const std::string& s) const { dump_string(out, s); }
		void operator()(const Array& arr) const {
			out.push_back('[');
			for (size_t i = 0; i < arr.size(); ++i) {
				if (i > 0) {
					out.push_back(',');
				}
				arr[i].dump(out);
			}
			out.push_back(']');
		}
		void operator()(const Object& obj) const {
			out.push_back('{');
			for (size_t i = 0; i < obj.size(); ++i) {
				if (i > 0) {
					out.push_back(',');
				}
				dump_string(out, obj[i].first);
				out.push_back(':');
				obj[i].second.dump(out);
			}
			out.push_back('}');
		}
	};
	std::visit(Visitor{out}, _value);
}

bool operator==(const RawNode& lhs, const RawNode& rhs) { return lhs._value == rhs._value; }

std::string_view to_string(RawNode::Type type) noexcept {
	switch (type) {
	case RawNode::Type::null:
		return "null";
	case RawNode::Type::boolean:
		return "boolean";
	case RawNode::Type::integer:
		return "integer";
	case RawNode::Type::number:
		return "number";
	case RawNode::Type::string:
		return "string";
	case RawNode::Type::array:
		return "array";
	case RawNode::Type::object:
		return "object";
	}
	return "unknown";
}

} // namespace sextant
