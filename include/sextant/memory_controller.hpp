// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>

namespace sextant {

class ResolutionCache;

struct MemoryOptions {
	bool enabled = false;
	std::size_t threshold_bytes = std::size_t(2) << 30;
	bool streaming_mode = false;
	std::size_t batch_size = 10;
	// Fraction of the cache kept when usage crosses the threshold.
	double low_watermark = 0.5;
};

struct MemoryStats {
	std::size_t heap_used = 0;
	double peak_usage_mb = 0.0;
	std::size_t cleanup_count = 0;
};

// Resident set size of this process in bytes, 0 where it cannot be read.
std::size_t ResidentMemoryBytes() noexcept;

// Paces catalog construction: decides the batch size and reacts to memory pressure
// between batches. Pressure is never an error; cleanup is best effort.
class MemoryController {
public:
	using Sampler = std::function<std::size_t()>;

	MemoryController();
	explicit MemoryController(MemoryOptions options, Sampler sampler = ResidentMemoryBytes);

	void configure(MemoryOptions options);
	MemoryOptions options() const;

	// Schemas per batch; 0 means everything at once.
	std::size_t batch_size() const;

	// Samples usage and, when enabled and above the threshold, evicts `cache` down to the low
	// watermark and returns freed heap to the system. Returns true if a cleanup ran.
	bool after_batch(ResolutionCache& cache);

	MemoryStats stats() const;

private:
	std::size_t Sample();

	MemoryOptions _options;
	Sampler _sampler;
	mutable std::mutex _mutex;
	MemoryStats _stats;
};

} // namespace sextant
