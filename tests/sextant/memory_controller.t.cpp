// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch_all.hpp>
#include <sextant/memory_controller.hpp>
#include <sextant/resolution_cache.hpp>

#include <fmt/format.h>

using namespace sextant;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

void Fill(ResolutionCache& cache, int entries) {
	for (int i = 0; i < entries; ++i) {
		cache.get_or_compute(fmt::format("k{}", i), [] {
			auto schema = std::make_shared<ResolvedSchema>();
			schema->shape = PrimitiveShape{"string", {}};
			return SchemaPtr(schema);
		});
	}
}

} // namespace

TEST_CASE("batch size only applies in streaming mode", "[memory]") {
	MemoryOptions options;
	options.batch_size = 10;
	MemoryController controller(options, [] { return std::size_t(0); });
	REQUIRE(controller.batch_size() == 0);

	options.streaming_mode = true;
	controller.configure(options);
	REQUIRE(controller.batch_size() == 10);
}

TEST_CASE("pressure above the threshold evicts to the watermark", "[memory]") {
	std::size_t usage = 300 * kMiB;
	MemoryOptions options;
	options.enabled = true;
	options.threshold_bytes = 200 * kMiB;
	MemoryController controller(options, [&usage] { return usage; });

	ResolutionCache cache;
	Fill(cache, 10);
	REQUIRE(controller.after_batch(cache));
	REQUIRE(cache.size() == 5);
	REQUIRE(controller.stats().cleanup_count == 1);
	REQUIRE(controller.stats().peak_usage_mb == Catch::Approx(300.0));

	usage = 100 * kMiB;
	REQUIRE_FALSE(controller.after_batch(cache));
	REQUIRE(cache.size() == 5);
	REQUIRE(controller.stats().cleanup_count == 1);
	REQUIRE(controller.stats().heap_used == usage);
	REQUIRE(controller.stats().peak_usage_mb == Catch::Approx(300.0));
}

TEST_CASE("disabled controller only samples", "[memory]") {
	MemoryController controller(MemoryOptions{}, [] { return 4096 * kMiB; });
	ResolutionCache cache;
	Fill(cache, 4);
	REQUIRE_FALSE(controller.after_batch(cache));
	REQUIRE(cache.size() == 4);
	REQUIRE(controller.stats().cleanup_count == 0);
	REQUIRE(controller.stats().peak_usage_mb == Catch::Approx(4096.0));
}

TEST_CASE("resident memory is readable", "[memory]") {
#ifdef __linux__
	REQUIRE(ResidentMemoryBytes() > 0);
#else
	REQUIRE(ResidentMemoryBytes() == 0);
#endif
}
