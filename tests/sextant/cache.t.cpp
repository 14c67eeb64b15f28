// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/resolution_cache.hpp>
#include <sextant/schema_composer.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "helpers.hpp"

using namespace sextant;
using sextant::test::Yaml;

namespace {

SchemaPtr Primitive(std::string type) {
	auto schema = std::make_shared<ResolvedSchema>();
	schema->shape = PrimitiveShape{std::move(type), {}};
	return schema;
}

} // namespace

TEST_CASE("fifty identical references hit the cache 49 times", "[cache]") {
	std::string text = "openapi: 3.0.3\ncomponents:\n  schemas:\n    Leaf: {type: string}\n"
					   "Root:\n  type: object\n  properties:\n";
	for (int i = 0; i < 50; ++i) {
		text += fmt::format("    p{}: {{$ref: '#/components/schemas/Leaf'}}\n", i);
	}
	const auto doc = Yaml(text);

	ResolutionCache cache;
	CacheMemo memo(cache);
	const ReferenceResolver resolver;
	const SchemaComposer composer(resolver, &memo);
	const auto root = composer.resolve_schema(doc, *doc->root.find("Root"));
	REQUIRE(root->object()->properties.size() == 50);
	REQUIRE(root->object()->properties[0].schema == root->object()->properties[49].schema);

	const auto stats = cache.stats();
	REQUIRE(stats.misses == 1);
	REQUIRE(stats.hits == 49);
	REQUIRE(stats.size == 1);
	REQUIRE(stats.hit_rate == Catch::Approx(0.98));
}

TEST_CASE("get_or_compute computes once per key", "[cache]") {
	ResolutionCache cache;
	int computed = 0;
	for (int i = 0; i < 50; ++i) {
		cache.get_or_compute("#/components/schemas/Leaf", [&] {
			++computed;
			return Primitive("string");
		});
	}
	REQUIRE(computed == 1);
	REQUIRE(cache.stats().hits == 49);
	REQUIRE(cache.stats().misses == 1);
	REQUIRE(cache.weight() == 1);
}

TEST_CASE("least recently used entries go first", "[cache]") {
	ResolutionCache cache(CacheOptions{true, 2});
	cache.get_or_compute("a", [] { return Primitive("string"); });
	cache.get_or_compute("b", [] { return Primitive("integer"); });
	cache.get_or_compute("a", [] { return Primitive("unused"); });
	cache.get_or_compute("c", [] { return Primitive("boolean"); });

	REQUIRE(cache.size() == 2);
	REQUIRE(cache.stats().evictions == 1);

	int computed = 0;
	const auto a = cache.get_or_compute("a", [&] {
		++computed;
		return Primitive("other");
	});
	REQUIRE(computed == 0);
	REQUIRE(a->primitive()->type == "string");
	cache.get_or_compute("b", [&] {
		++computed;
		return Primitive("integer");
	});
	REQUIRE(computed == 1);
}

TEST_CASE("shrinking the cache evicts at once", "[cache]") {
	ResolutionCache cache;
	for (int i = 0; i < 10; ++i) {
		cache.get_or_compute(fmt::format("k{}", i), [] { return Primitive("string"); });
	}
	REQUIRE(cache.evict_to(6) == 4);
	cache.configure(CacheOptions{true, 3});
	REQUIRE(cache.size() == 3);
	REQUIRE(cache.stats().evictions == 7);
	REQUIRE(cache.stats().max_size == 3);

	cache.clear();
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.stats().hits == 0);
	REQUIRE(cache.stats().evictions == 0);
}

TEST_CASE("disabled cache always computes", "[cache]") {
	ResolutionCache cache(CacheOptions{false, 500});
	int computed = 0;
	for (int i = 0; i < 3; ++i) {
		cache.get_or_compute("same", [&] {
			++computed;
			return Primitive("string");
		});
	}
	REQUIRE(computed == 3);
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.stats().misses == 3);
	REQUIRE(cache.stats().hits == 0);
}

TEST_CASE("results marked non-cacheable are not stored", "[cache]") {
	ResolutionCache cache;
	int computed = 0;
	for (int i = 0; i < 2; ++i) {
		cache.get_or_compute("partial", [&] {
			++computed;
			return Computed{Primitive("string"), false, nullptr};
		});
	}
	REQUIRE(computed == 2);
	REQUIRE(cache.size() == 0);
}

TEST_CASE("entries rejected by the caller are recomputed", "[cache]") {
	ResolutionCache cache;
	const auto deps = std::make_shared<const Dependencies>(Dependencies{"<test>#/components/schemas/B"});
	cache.lookup_or_compute("A", {}, [&] { return Computed{Primitive("string"), true, deps}; });

	int computed = 0;
	const auto reject_b = [](const Dependencies& d) { return d.empty() || d.front() != "<test>#/components/schemas/B"; };
	const auto result = cache.lookup_or_compute("A", reject_b, [&] {
		++computed;
		return Computed{Primitive("integer"), true, std::make_shared<const Dependencies>()};
	});
	REQUIRE(computed == 1);
	REQUIRE(result.value->primitive()->type == "integer");

	// The fresh value replaced the stored one.
	const auto again = cache.lookup_or_compute("A", reject_b, [&] {
		++computed;
		return Computed{};
	});
	REQUIRE(computed == 1);
	REQUIRE(again.value->primitive()->type == "integer");
}

TEST_CASE("failed computations are not stored", "[cache]") {
	ResolutionCache cache;
	REQUIRE_THROWS_AS(
		cache.get_or_compute("bad", []() -> SchemaPtr { throw std::runtime_error("boom"); }), std::runtime_error);
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.get_or_compute("bad", [] { return Primitive("string"); })->primitive()->type == "string");
}

TEST_CASE("concurrent requests for one key compute once", "[cache][concurrency]") {
	ResolutionCache cache;
	std::atomic<int> computed{0};
	std::vector<std::thread> threads;
	std::vector<SchemaPtr> results(8);
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&, i] {
			results[i] = cache.get_or_compute("shared", [&] {
				++computed;
				std::this_thread::sleep_for(std::chrono::milliseconds(50));
				return Primitive("string");
			});
		});
	}
	for (auto& t : threads) {
		t.join();
	}
	REQUIRE(computed == 1);
	for (const auto& result : results) {
		REQUIRE(result == results.front());
	}
	REQUIRE(cache.stats().misses == 1);
	REQUIRE(cache.stats().hits == 7);
}

TEST_CASE("threads waiting on each other do not deadlock", "[cache][concurrency]") {
	ResolutionCache cache;
	std::atomic<int> started{0};
	const auto wait_for_both = [&] {
		++started;
		while (started < 2) {
			std::this_thread::yield();
		}
	};

	SchemaPtr first;
	SchemaPtr second;
	std::thread a([&] {
		first = cache.get_or_compute("x", [&] {
			wait_for_both();
			return cache.get_or_compute("y", [] { return Primitive("from-a"); });
		});
	});
	std::thread b([&] {
		second = cache.get_or_compute("y", [&] {
			wait_for_both();
			return cache.get_or_compute("x", [] { return Primitive("from-b"); });
		});
	});
	a.join();
	b.join();
	REQUIRE(first != nullptr);
	REQUIRE(second != nullptr);
}
