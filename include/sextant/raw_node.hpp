// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sextant {

// Untyped document tree, as produced by the JSON and YAML loaders.
// Objects keep their members in declaration order.
class RawNode {
public:
	using Null = std::monostate;
	using Array = std::vector<RawNode>;
	using Member = std::pair<std::string, RawNode>;
	using Object = std::vector<Member>;
	using Value = std::variant<Null, bool, std::int64_t, double, std::string, Array, Object>;

	enum class Type : uint8_t { null, boolean, integer, number, string, array, object };

	RawNode() noexcept = default;
	RawNode(std::nullptr_t) noexcept {}
	RawNode(bool b)
		: _value(b) {}
	RawNode(std::int64_t i)
		: _value(i) {}
	RawNode(int i)
		: _value(static_cast<std::int64_t>(i)) {}
	RawNode(double d)
		: _value(d) {}
	RawNode(std::string s)
		: _value(std::move(s)) {}
	RawNode(const char* s)
		: _value(std::string(s)) {}
	RawNode(Array a)
		: _value(std::move(a)) {}
	RawNode(Object o)
		: _value(std::move(o)) {}

	Type type() const noexcept { return static_cast<Type>(_value.index()); }

	bool is_null() const noexcept { return std::holds_alternative<Null>(_value); }
	bool is_bool() const noexcept { return std::holds_alternative<bool>(_value); }
	bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(_value); }
	bool is_number() const noexcept { return is_integer() || std::holds_alternative<double>(_value); }
	bool is_string() const noexcept { return std::holds_alternative<std::string>(_value); }
	bool is_array() const noexcept { return std::holds_alternative<Array>(_value); }
	bool is_object() const noexcept { return std::holds_alternative<Object>(_value); }

	bool as_bool() const { return std::get<bool>(_value); }
	std::int64_t as_integer() const { return std::get<std::int64_t>(_value); }
	double as_number() const;
	const std::string& as_string() const { return std::get<std::string>(_value); }
	const Array& as_array() const { return std::get<Array>(_value); }
	const Object& as_object() const { return std::get<Object>(_value); }
	Array& as_array() { return std::get<Array>(_value); }
	Object& as_object() { return std::get<Object>(_value); }

	const Value& value() const noexcept { return _value; }

	// Member lookup. Returns nullptr when this is not an object or the key is absent.
	const RawNode* find(std::string_view key) const noexcept;
	bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

	// Convenience accessors for optional scalar members.
	std::string_view string_or(std::string_view key, std::string_view fallback = {}) const noexcept;
	bool bool_or(std::string_view key, bool fallback = false) const noexcept;

	// Appends a member to an object node (the node becomes an object if it is null).
	RawNode& emplace(std::string key, RawNode value);

	// Compact JSON rendering. Member order is preserved, so equal documents dump equally.
	std::string dump() const;
	void dump(std::string& out) const;

	friend bool operator==(const RawNode& lhs, const RawNode& rhs);

private:
	Value _value;
};

std::string_view to_string(RawNode::Type type) noexcept;

} // namespace sextant
