// SPDX-License-Identifier: Apache-2.0
#include <sextant/resolved_schema.hpp>

#include <fmt/format.h>

namespace sextant {

namespace {

template <class... Ts>
struct Visitor : Ts... {
	using Ts::operator()...;
};
template <class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;

bool VariantsEqual(const std::vector<SchemaPtr>& lhs, const std::vector<SchemaPtr>& rhs) {
	if (lhs.size() != rhs.size()) {
		return false;
	}
	for (size_t i = 0; i < lhs.size(); ++i) {
		if (!structurally_equal(lhs[i], rhs[i])) {
			return false;
		}
	}
	return true;
}

bool ShapesEqual(const ObjectShape& lhs, const ObjectShape& rhs) {
	if (lhs.properties.size() != rhs.properties.size() || lhs.required != rhs.required ||
		lhs.discriminator != rhs.discriminator ||
		!structurally_equal(lhs.additional_properties, rhs.additional_properties)) {
		return false;
	}
	for (size_t i = 0; i < lhs.properties.size(); ++i) {
		const auto& l = lhs.properties[i];
		const auto& r = rhs.properties[i];
		if (l.name != r.name || l.required != r.required || !structurally_equal(l.schema, r.schema)) {
			return false;
		}
	}
	return true;
}

bool ShapesEqual(const ArrayShape& lhs, const ArrayShape& rhs) { return structurally_equal(lhs.items, rhs.items); }

bool ShapesEqual(const PrimitiveShape& lhs, const PrimitiveShape& rhs) {
	return lhs.type == rhs.type && lhs.format == rhs.format;
}

bool ShapesEqual(const UnionShape& lhs, const UnionShape& rhs) {
	return lhs.discriminator == rhs.discriminator && VariantsEqual(lhs.variants, rhs.variants);
}

bool ShapesEqual(const FlexibleUnionShape& lhs, const FlexibleUnionShape& rhs) {
	return VariantsEqual(lhs.variants, rhs.variants);
}

bool ShapesEqual(const RecursiveShape& lhs, const RecursiveShape& rhs) {
	return lhs.name == rhs.name && lhs.pointer == rhs.pointer;
}

void Describe(const SchemaPtr& schema, std::string& out);

void DescribeVariants(const std::vector<SchemaPtr>& variants, std::string& out) {
	out.push_back('[');
	for (size_t i = 0; i < variants.size(); ++i) {
		if (i != 0) {
			out += " | ";
		}
		Describe(variants[i], out);
	}
	out.push_back(']');
}

void Describe(const ResolvedSchema& schema, std::string& out) {
	std::visit(Visitor{
				   [&](const ObjectShape& obj) {
					   out += "object{";
					   bool first = true;
					   for (const auto& prop : obj.properties) {
						   if (!first) {
							   out += ", ";
						   }
						   first = false;
						   out += prop.name;
						   out.push_back(':');
						   Describe(prop.schema, out);
						   if (prop.required) {
							   out.push_back('!');
						   }
					   }
					   if (obj.additional_properties) {
						   if (!first) {
							   out += ", ";
						   }
						   out += "*:";
						   Describe(obj.additional_properties, out);
					   }
					   out.push_back('}');
				   },
				   [&](const ArrayShape& arr) {
					   out += "array<";
					   Describe(arr.items, out);
					   out.push_back('>');
				   },
				   [&](const PrimitiveShape& prim) {
					   out += prim.type.empty() ? std::string_view("any") : std::string_view(prim.type);
					   if (!prim.format.empty()) {
						   out += fmt::format("({})", prim.format);
					   }
				   },
				   [&](const UnionShape& uni) {
					   out += "oneOf";
					   if (uni.discriminator) {
						   out += fmt::format("({})", uni.discriminator->property_name);
					   }
					   DescribeVariants(uni.variants, out);
				   },
				   [&](const FlexibleUnionShape& uni) {
					   out += "anyOf";
					   DescribeVariants(uni.variants, out);
				   },
				   [&](const RecursiveShape& rec) {
					   out.push_back('#');
					   out += rec.name;
				   },
			   },
		schema.shape);
	if (schema.nullable) {
		out.push_back('?');
	}
}

void Describe(const SchemaPtr& schema, std::string& out) {
	if (!schema) {
		out += "any";
		return;
	}
	Describe(*schema, out);
}

std::size_t SizeHint(const SchemaPtr& schema) noexcept { return schema ? schema->size_hint() : 0; }

} // namespace

const Property* ResolvedSchema::property(std::string_view name) const noexcept {
	if (const auto* obj = object()) {
		for (const auto& prop : obj->properties) {
			if (prop.name == name) {
				return &prop;
			}
		}
	}
	return nullptr;
}

const RawNode* ResolvedSchema::constraint(std::string_view keyword) const noexcept {
	for (const auto& [key, value] : validation_constraints) {
		if (key == keyword) {
			return &value;
		}
	}
	return nullptr;
}

std::size_t ResolvedSchema::size_hint() const noexcept {
	std::size_t n = 1;
	std::visit(Visitor{
				   [&](const ObjectShape& obj) {
					   for (const auto& prop : obj.properties) {
						   n += SizeHint(prop.schema);
					   }
					   n += SizeHint(obj.additional_properties);
				   },
				   [&](const ArrayShape& arr) { n += SizeHint(arr.items); },
				   [&](const UnionShape& uni) {
					   for (const auto& v : uni.variants) {
						   n += SizeHint(v);
					   }
				   },
				   [&](const FlexibleUnionShape& uni) {
					   for (const auto& v : uni.variants) {
						   n += SizeHint(v);
					   }
				   },
				   [](const auto&) {},
			   },
		shape);
	return n;
}

std::string_view to_string(SchemaKind kind) noexcept {
	switch (kind) {
	case SchemaKind::object:
		return "object";
	case SchemaKind::array:
		return "array";
	case SchemaKind::primitive:
		return "primitive";
	case SchemaKind::one_of:
		return "union";
	case SchemaKind::any_of:
		return "flexibleUnion";
	case SchemaKind::recursive:
		return "recursive";
	}
	return "unknown";
}

std::string_view to_string(Composition composition) noexcept {
	switch (composition) {
	case Composition::all_of:
		return "allOf";
	case Composition::one_of:
		return "oneOf";
	case Composition::any_of:
		return "anyOf";
	default:
		break;
	}
	return "none";
}

bool structurally_equal(const ResolvedSchema& lhs, const ResolvedSchema& rhs) {
	if (&lhs == &rhs) {
		return true;
	}
	if (lhs.shape.index() != rhs.shape.index() || lhs.nullable != rhs.nullable ||
		lhs.composition != rhs.composition || lhs.source_name != rhs.source_name || !(lhs.metadata == rhs.metadata) ||
		lhs.validation_constraints != rhs.validation_constraints) {
		return false;
	}
	return std::visit(
		[&](const auto& l) {
			using T = std::decay_t<decltype(l)>;
			return ShapesEqual(l, std::get<T>(rhs.shape));
		},
		lhs.shape);
}

bool structurally_equal(const SchemaPtr& lhs, const SchemaPtr& rhs) {
	if (!lhs || !rhs) {
		return !lhs && !rhs;
	}
	return structurally_equal(*lhs, *rhs);
}

std::string describe(const ResolvedSchema& schema) {
	std::string out;
	Describe(schema, out);
	return out;
}

} // namespace sextant
