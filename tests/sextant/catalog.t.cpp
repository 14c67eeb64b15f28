// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/error.hpp>
#include <sextant/schema_catalog.hpp>

#include <stop_token>

#include <fmt/format.h>

#include "helpers.hpp"

using namespace sextant;
using sextant::test::DataPath;
using sextant::test::Yaml;

namespace {

const std::string header = R"(
openapi: 3.0.3
info: {title: Catalog, version: "1"}
)";

const std::string users = header + R"(
tags:
  - name: users
paths:
  /users/{id}:
    parameters:
      - name: id
        in: path
        schema: {type: string}
    get:
      tags: [users, admin]
      operationId: getUser
      parameters:
        - $ref: '#/components/parameters/Verbose'
      responses:
        "200":
          description: The user
          content:
            application/json:
              schema: {$ref: '#/components/schemas/User'}
        "404":
          description: Not found
    delete:
      tags: [admin]
      deprecated: true
      requestBody:
        required: true
        content:
          application/json:
            schema: {$ref: '#/components/schemas/BaseEntity'}
      responses:
        "204": {description: Deleted}
    summary: not an operation
components:
  parameters:
    Verbose:
      name: verbose
      in: query
      schema: {type: boolean}
  schemas:
    User:
      allOf:
        - $ref: '#/components/schemas/BaseEntity'
        - type: object
          properties:
            name: {type: string}
    BaseEntity:
      type: object
      properties:
        id: {type: integer}
)";

// `count` schemas S0..S<count-1>, each pointing at a shared leaf.
std::string Many(int count) {
	std::string text = header + "paths: {}\ncomponents:\n  schemas:\n    Leaf: {type: string}\n";
	for (int i = 0; i < count; ++i) {
		text += fmt::format(
			"    S{}:\n      type: object\n      properties:\n        n: {{type: integer}}\n        leaf: {{$ref: '#/components/schemas/Leaf'}}\n",
			i);
	}
	return text;
}

Config Workers(std::size_t workers) {
	Config config;
	config.worker_threads = workers;
	config.metrics_enabled = true;
	return config;
}

} // namespace

TEST_CASE("schemas keep declaration order", "[catalog]") {
	const auto doc = Yaml(header + R"(
paths: {}
components:
  schemas:
    B:
      type: object
      properties:
        a: {$ref: '#/components/schemas/A'}
    A: {type: string}
    C: {type: integer}
)");
	CatalogBuilder builder(Workers(4));
	const auto catalog = builder.build(doc);
	REQUIRE(catalog->schemas.size() == 3);
	REQUIRE(catalog->schemas[0].first == "B");
	REQUIRE(catalog->schemas[1].first == "A");
	REQUIRE(catalog->schemas[2].first == "C");
	REQUIRE(describe(*catalog->find("B")) == "object{a:string}");
	REQUIRE(catalog->find("Z") == nullptr);
}

TEST_CASE("allOf user end to end", "[catalog]") {
	CatalogBuilder builder;
	const auto catalog = builder.build(Yaml(users));
	const auto user = catalog->find("User");
	REQUIRE(user->kind() == SchemaKind::object);
	REQUIRE(user->composition == Composition::all_of);
	REQUIRE(describe(*user) == "object{id:integer, name:string}");
	REQUIRE(user->property("id")->schema->primitive()->type == "integer");
	REQUIRE(user->property("name")->schema->primitive()->type == "string");
}

TEST_CASE("operations and tags are collected", "[catalog]") {
	CatalogBuilder builder;
	const auto catalog = builder.build(Yaml(users));
	REQUIRE(catalog->tags == std::vector<std::string>{"admin", "users"});
	REQUIRE(catalog->operations.size() == 2);

	const auto& get = catalog->operations[0];
	REQUIRE(get.method == RequestMethod::GET);
	REQUIRE(get.operation_id == "getUser");
	REQUIRE(get.parameters.size() == 2);
	REQUIRE(get.parameters[0].name == "id");
	REQUIRE(get.parameters[0].required);
	REQUIRE(get.parameters[1].name == "verbose");
	REQUIRE(get.parameters[1].location == "query");
	REQUIRE_FALSE(get.parameters[1].required);
	REQUIRE(get.responses.size() == 2);
	REQUIRE(get.responses[0].content[0].schema->source_name == "User");
	REQUIRE(get.responses[1].content.empty());
	REQUIRE_FALSE(get.request_body.has_value());

	const auto& del = catalog->operations[1];
	REQUIRE(del.operation_id == "delete__users__id_");
	REQUIRE(del.deprecated);
	REQUIRE(del.request_body->required);
	REQUIRE(del.request_body->content[0].media_type == "application/json");
	REQUIRE(del.parameters.size() == 1);
}

TEST_CASE("external schemas of a file document", "[catalog][external]") {
	CatalogBuilder builder(Config{}, std::make_shared<FileExternalResolver>());
	const auto catalog = builder.build(load_document(DataPath("petstore.json")));
	REQUIRE(catalog->tags == std::vector<std::string>{"pets"});
	REQUIRE(describe(*catalog->find("Pet")) ==
		"object{id:integer(int64)!, name:string!, owner:object{name:string, address:object{city:string}}}");

	const auto& op = catalog->operations.at(0);
	REQUIRE(op.operation_id == "getPet");
	REQUIRE(op.parameters.at(0).required);
	REQUIRE(describe(*op.parameters.at(0).schema) == "integer(int64)");
	REQUIRE(op.responses.at(1).status == "default");
	REQUIRE(op.responses.at(1).description == "Unexpected error");
	REQUIRE(describe(*op.responses.at(1).content.at(0).schema) == "object{code:integer!, message:string}");
}

TEST_CASE("every failure is reported at once", "[catalog]") {
	const auto doc = Yaml(header + R"(
paths:
  /broken:
    post:
      requestBody:
        content:
          application/json:
            schema: {$ref: '#/components/schemas/Nowhere'}
      responses: {}
components:
  schemas:
    Dangling:
      type: object
      properties:
        x: {$ref: '#/components/schemas/Missing'}
    Fine: {type: string}
    Empty:
      anyOf: []
)");
	CatalogBuilder builder;
	try {
		builder.build(doc);
		FAIL("no error");
	} catch (const CatalogError& e) {
		REQUIRE(e.kind() == ErrorCode::catalog_failed);
		const auto& failures = e.failures();
		REQUIRE(failures.size() == 3);
		REQUIRE(failures[0].subject == "Dangling");
		REQUIRE_THAT(failures[0].message, Catch::Matchers::ContainsSubstring("/components/schemas/Dangling/properties/x"));
		REQUIRE_THROWS_AS(std::rethrow_exception(failures[0].error), ReferenceNotFoundError);
		REQUIRE(failures[1].subject == "Empty");
		REQUIRE_THROWS_AS(std::rethrow_exception(failures[1].error), UnsupportedSchemaShapeError);
		REQUIRE(failures[2].subject == "post /broken");
		REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("3 schema(s) failed"));
	}
}

TEST_CASE("streaming keeps at most one batch in flight", "[catalog][streaming]") {
	Config config = Workers(16);
	config.streaming_mode_enabled = true;
	config.batch_size = 10;
	CatalogBuilder builder(config);

	std::size_t observed = 0;
	builder.on_batch([&](std::size_t done, std::size_t total) {
		REQUIRE(done == observed + 10);
		REQUIRE(total == 500);
		observed = done;
	});
	const auto catalog = builder.build(Yaml(Many(499)));
	REQUIRE(catalog->schemas.size() == 500);
	REQUIRE(catalog->schemas.back().first == "S498");

	const auto metrics = builder.metrics();
	REQUIRE(metrics.has_value());
	REQUIRE(metrics->schemas_resolved == 500);
	REQUIRE(metrics->batches == 50);
	REQUIRE(metrics->peak_in_flight >= 1);
	REQUIRE(metrics->peak_in_flight <= 10);
	REQUIRE(metrics->cache.hits > 0);
	REQUIRE(observed == 500);
}

TEST_CASE("stop request returns the finished batches", "[catalog][streaming]") {
	Config config = Workers(2);
	config.streaming_mode_enabled = true;
	config.batch_size = 10;
	CatalogBuilder builder(config);

	std::stop_source stop;
	builder.on_batch([&](std::size_t done, std::size_t) {
		if (done >= 20) {
			stop.request_stop();
		}
	});
	try {
		builder.build(Yaml(Many(49)), stop.get_token());
		FAIL("no error");
	} catch (const CancelledError& e) {
		REQUIRE(e.kind() == ErrorCode::cancelled);
		REQUIRE(e.partial()->schemas.size() == 20);
		REQUIRE(e.partial()->schemas[0].first == "Leaf");
		REQUIRE(e.partial()->schemas[19].first == "S18");
	}
	REQUIRE(builder.metrics()->batches == 2);
}

TEST_CASE("memory pressure triggers cleanup between batches", "[catalog][memory]") {
	Config config = Workers(1);
	config.streaming_mode_enabled = true;
	config.batch_size = 5;
	config.memory_optimization_enabled = true;
	config.memory_threshold_bytes = 1024;
	CatalogBuilder builder(config, nullptr, [] { return std::size_t(1) << 20; });

	const auto catalog = builder.build(Yaml(Many(19)));
	REQUIRE(catalog->schemas.size() == 20);
	const auto metrics = builder.metrics();
	REQUIRE(metrics->memory.cleanup_count == 4);
	REQUIRE(metrics->cache.evictions > 0);
}

TEST_CASE("metrics stay private unless enabled", "[catalog]") {
	CatalogBuilder builder;
	builder.build(Yaml(Many(3)));
	REQUIRE_FALSE(builder.metrics().has_value());
}

TEST_CASE("invalid configuration is rejected up front", "[catalog]") {
	Config config;
	config.worker_threads = 0;
	REQUIRE_THROWS_AS(CatalogBuilder(config), std::invalid_argument);
}
