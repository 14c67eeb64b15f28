// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "raw_node.hpp"

namespace sextant {

struct ResolvedSchema;

// Resolved schemas are immutable once built and shared between the cache, the catalog and
// every schema that embeds them.
using SchemaPtr = std::shared_ptr<const ResolvedSchema>;

enum class SchemaKind : uint8_t {
	object,
	array,
	primitive,
	one_of, // union
	any_of, // flexible union
	recursive,
};

// How the node was produced. allOf results keep their base kind and are flagged here.
enum class Composition : uint8_t { none, all_of, one_of, any_of };

struct Discriminator {
	std::string property_name;
	// Discriminator value -> schema name, in declaration order.
	std::vector<std::pair<std::string, std::string>> mapping;

	friend bool operator==(const Discriminator&, const Discriminator&) = default;
};

struct Property {
	std::string name;
	SchemaPtr schema;
	bool required = false;
};

struct ObjectShape {
	std::vector<Property> properties;
	// Every name listed under "required", including names another allOf branch defines.
	std::vector<std::string> required;
	// Schema form of additionalProperties; the boolean form stays in the constraints.
	SchemaPtr additional_properties;
	std::optional<Discriminator> discriminator;
};

struct ArrayShape {
	SchemaPtr items; // nullptr when "items" is absent
};

// string, integer, number, boolean, null, or empty for an untyped schema.
struct PrimitiveShape {
	std::string type;
	std::string format;
};

struct UnionShape {
	std::vector<SchemaPtr> variants;
	std::optional<Discriminator> discriminator;
};

struct FlexibleUnionShape {
	std::vector<SchemaPtr> variants;
};

// Back-edge to a named schema that is still being resolved further up the tree.
struct RecursiveShape {
	std::string name;
	std::string pointer;
};

struct Metadata {
	std::string title;
	std::string description;
	std::optional<RawNode> example;
	std::optional<RawNode> default_value;
	bool deprecated = false;
	bool read_only = false;
	bool write_only = false;

	friend bool operator==(const Metadata&, const Metadata&) = default;
};

struct ResolvedSchema {
	using Shape = std::variant<ObjectShape, ArrayShape, PrimitiveShape, UnionShape, FlexibleUnionShape, RecursiveShape>;

	Shape shape;
	bool nullable = false;
	// Validation keywords and x-* extensions, verbatim and in declaration order.
	RawNode::Object validation_constraints;
	// Name under components.schemas, empty for inline schemas.
	std::string source_name;
	Metadata metadata;
	Composition composition = Composition::none;

	SchemaKind kind() const noexcept { return static_cast<SchemaKind>(shape.index()); }

	const ObjectShape* object() const noexcept { return std::get_if<ObjectShape>(&shape); }
	const ArrayShape* array() const noexcept { return std::get_if<ArrayShape>(&shape); }
	const PrimitiveShape* primitive() const noexcept { return std::get_if<PrimitiveShape>(&shape); }
	const UnionShape* one_of() const noexcept { return std::get_if<UnionShape>(&shape); }
	const FlexibleUnionShape* any_of() const noexcept { return std::get_if<FlexibleUnionShape>(&shape); }
	const RecursiveShape* recursive() const noexcept { return std::get_if<RecursiveShape>(&shape); }

	const Property* property(std::string_view name) const noexcept;
	const RawNode* constraint(std::string_view keyword) const noexcept;

	// Number of nodes in this tree, used as the cache size hint.
	std::size_t size_hint() const noexcept;
};

std::string_view to_string(SchemaKind kind) noexcept;
std::string_view to_string(Composition composition) noexcept;

// Deep comparison of shape, flags, constraints, names and metadata.
bool structurally_equal(const ResolvedSchema& lhs, const ResolvedSchema& rhs);
bool structurally_equal(const SchemaPtr& lhs, const SchemaPtr& rhs);

// Deterministic one-line signature, e.g. "object{id:integer(int64)!, tags:array<string>}".
std::string describe(const ResolvedSchema& schema);

} // namespace sextant
