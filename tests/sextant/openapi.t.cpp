// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/openapi.hpp>

#include "util.hpp"

using namespace sextant;

TEST_CASE("request methods parse without case", "[openapi]") {
	REQUIRE(RequestMethodFromString("get") == RequestMethod::GET);
	REQUIRE(RequestMethodFromString("Post") == RequestMethod::POST);
	REQUIRE(RequestMethodFromString("DELETE") == RequestMethod::DELETE);
	REQUIRE(RequestMethodFromString("parameters") == RequestMethod::UNKNOWN);
	REQUIRE(RequestMethodFromString("summary") == RequestMethod::UNKNOWN);
	REQUIRE(RequestMethodToString(RequestMethod::PATCH) == "patch");
	REQUIRE(RequestMethodToString(RequestMethod::UNKNOWN) == "unknown");
}

TEST_CASE("function names are synthesized from the path", "[openapi]") {
	REQUIRE(SynthesizeFunctionName("/pets/{petId}", RequestMethod::GET) == "get__pets__petId_");
	REQUIRE(SynthesizeFunctionName("/store/order-items", RequestMethod::POST) == "post__store_order_items");
}

TEST_CASE("sanitize produces identifiers", "[openapi]") {
	REQUIRE(sanitize(std::string_view("user.name")) == "user_name");
	REQUIRE(sanitize(std::string_view("delete")) == "delete_");
	REQUIRE(sanitize(std::string_view("3d")) == "_3d");
	REQUIRE(compare_ignore_case("Content-Type", "content-type"));
	REQUIRE_FALSE(compare_ignore_case("Content", "content-type"));
}
