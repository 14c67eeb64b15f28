// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/resolved_schema.hpp>

using namespace sextant;

namespace {

SchemaPtr Prim(std::string type, std::string format = {}) {
	auto schema = std::make_shared<ResolvedSchema>();
	schema->shape = PrimitiveShape{std::move(type), std::move(format)};
	return schema;
}

std::shared_ptr<ResolvedSchema> Pet() {
	auto pet = std::make_shared<ResolvedSchema>();
	ObjectShape obj;
	obj.properties.push_back(Property{"id", Prim("integer", "int64"), true});
	obj.properties.push_back(Property{"tags", nullptr, false});
	auto tags = std::make_shared<ResolvedSchema>();
	tags->shape = ArrayShape{Prim("string")};
	obj.properties.back().schema = tags;
	obj.required = {"id"};
	obj.additional_properties = Prim("string");
	pet->shape = std::move(obj);
	pet->source_name = "Pet";
	pet->validation_constraints.emplace_back("x-entity", RawNode(true));
	return pet;
}

} // namespace

TEST_CASE("kind follows the shape", "[resolved_schema]") {
	REQUIRE(Prim("string")->kind() == SchemaKind::primitive);
	REQUIRE(Pet()->kind() == SchemaKind::object);
	REQUIRE(to_string(SchemaKind::one_of) == "union");
	REQUIRE(to_string(SchemaKind::recursive) == "recursive");
	REQUIRE(to_string(Composition::all_of) == "allOf");
}

TEST_CASE("describe renders a stable signature", "[resolved_schema]") {
	const auto pet = Pet();
	REQUIRE(describe(*pet) == "object{id:integer(int64)!, tags:array<string>, *:string}");

	auto nullable = Prim("string");
	auto copy = std::make_shared<ResolvedSchema>(*nullable);
	copy->nullable = true;
	REQUIRE(describe(*copy) == "string?");

	auto uni = std::make_shared<ResolvedSchema>();
	uni->shape = UnionShape{{Prim("string"), Prim("integer")}, Discriminator{"kind", {}}};
	REQUIRE(describe(*uni) == "oneOf(kind)[string | integer]");

	auto back = std::make_shared<ResolvedSchema>();
	back->shape = RecursiveShape{"Pet", "#/components/schemas/Pet"};
	REQUIRE(describe(*back) == "#Pet");
	REQUIRE(describe(*Prim("")) == "any");
}

TEST_CASE("structural equality is deep", "[resolved_schema]") {
	const auto a = Pet();
	const auto b = Pet();
	REQUIRE(a != b);
	REQUIRE(structurally_equal(a, b));

	b->metadata.description = "changed";
	REQUIRE_FALSE(structurally_equal(a, b));

	const auto c = Pet();
	auto& obj = std::get<ObjectShape>(c->shape);
	obj.properties[0].schema = Prim("integer", "int32");
	REQUIRE_FALSE(structurally_equal(a, c));

	const auto d = Pet();
	d->validation_constraints.clear();
	REQUIRE_FALSE(structurally_equal(a, d));

	REQUIRE(structurally_equal(SchemaPtr(), SchemaPtr()));
	REQUIRE_FALSE(structurally_equal(SchemaPtr(a), SchemaPtr()));
}

TEST_CASE("lookups and size hint", "[resolved_schema]") {
	const auto pet = Pet();
	REQUIRE(pet->property("id")->required);
	REQUIRE(pet->property("missing") == nullptr);
	REQUIRE(pet->constraint("x-entity")->as_bool());
	REQUIRE(pet->constraint("minLength") == nullptr);
	// pet, id, tags, tags items, additionalProperties
	REQUIRE(pet->size_hint() == 5);
}
