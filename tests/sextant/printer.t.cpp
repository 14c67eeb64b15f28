// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/printer.hpp>

#include <sstream>

#include "helpers.hpp"

using namespace sextant;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("printer indents nested writes", "[printer]") {
	std::ostringstream out;
	Printer p(out);
	p.write("a");
	p.indent().write("b", 1);
	p.indent().write_fmt("{}-{}", "c", 2);
	p.outdent().outdent().outdent().write("d");
	REQUIRE(out.str() == "a\n\tb1\n\t\tc-2\nd\n");
}

TEST_CASE("catalog dump lists schemas and operations", "[printer]") {
	const auto doc = test::Yaml(R"(
openapi: 3.0.3
info: {title: Dump, version: "1"}
tags: [{name: pets}]
paths:
  /pets:
    get:
      operationId: listPets
      parameters:
        - {name: limit, in: query, schema: {type: integer}}
      responses:
        "200":
          description: ok
          content:
            application/json:
              schema:
                type: array
                items: {$ref: '#/components/schemas/Pet'}
components:
  schemas:
    Pet:
      type: object
      required: [name]
      properties:
        name: {type: string, minLength: 1}
        parent: {$ref: '#/components/schemas/Pet'}
)");
	CatalogBuilder builder;
	const auto catalog = builder.build(doc);

	std::ostringstream out;
	Printer p(out);
	PrintCatalog(p, *catalog);
	const auto text = out.str();
	REQUIRE_THAT(text, ContainsSubstring("schemas:\n\tPet:\n\t\tobject\n"));
	REQUIRE_THAT(text, ContainsSubstring("\t\t\tname*: primitive\n\t\t\t\tminLength: 1\n"));
	REQUIRE_THAT(text, ContainsSubstring("parent: recursive"));
	REQUIRE_THAT(text, ContainsSubstring("-> #/components/schemas/Pet"));
	REQUIRE_THAT(text, ContainsSubstring("tags:\n\tpets\n"));
	REQUIRE_THAT(text, ContainsSubstring("get /pets (listPets)"));
	REQUIRE_THAT(text, ContainsSubstring("limit in query: integer"));
	REQUIRE_THAT(text, ContainsSubstring("200 application/json: array<object{name:string!, parent:#Pet}>"));
}
