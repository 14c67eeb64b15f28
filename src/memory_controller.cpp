// SPDX-License-Identifier: Apache-2.0
#include <sextant/log.hpp>
#include <sextant/memory_controller.hpp>
#include <sextant/resolution_cache.hpp>

#include <algorithm>
#include <cstdio>
#include <utility>

#ifdef __linux__
#include <malloc.h>
#include <unistd.h>
#endif

namespace sextant {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

void ReleaseFreeHeap() noexcept {
#if defined(__linux__) && defined(__GLIBC__)
	malloc_trim(0);
#endif
}

} // namespace

std::size_t ResidentMemoryBytes() noexcept {
#ifdef __linux__
	std::FILE* statm = std::fopen("/proc/self/statm", "r");
	if (statm == nullptr) {
		return 0;
	}
	unsigned long size = 0;
	unsigned long resident = 0;
	const int read = std::fscanf(statm, "%lu %lu", &size, &resident);
	std::fclose(statm);
	if (read != 2) {
		return 0;
	}
	const long page = sysconf(_SC_PAGESIZE);
	return static_cast<std::size_t>(resident) * static_cast<std::size_t>(page > 0 ? page : 4096);
#else
	return 0;
#endif
}

MemoryController::MemoryController()
	: MemoryController(MemoryOptions{}) {}

MemoryController::MemoryController(MemoryOptions options, Sampler sampler)
	: _options(options)
	, _sampler(std::move(sampler)) {}

void MemoryController::configure(MemoryOptions options) {
	std::lock_guard lock(_mutex);
	_options = options;
}

MemoryOptions MemoryController::options() const {
	std::lock_guard lock(_mutex);
	return _options;
}

std::size_t MemoryController::batch_size() const {
	std::lock_guard lock(_mutex);
	return _options.streaming_mode ? std::max<std::size_t>(_options.batch_size, 1) : 0;
}

bool MemoryController::after_batch(ResolutionCache& cache) {
	std::unique_lock lock(_mutex);
	const auto used = Sample();
	if (!_options.enabled || used <= _options.threshold_bytes) {
		return false;
	}
	const auto threshold = _options.threshold_bytes;
	const auto watermark = std::clamp(_options.low_watermark, 0.0, 1.0);
	lock.unlock();

	const auto keep = static_cast<std::size_t>(static_cast<double>(cache.size()) * watermark);
	const auto evicted = cache.evict_to(keep);
	ReleaseFreeHeap();

	lock.lock();
	++_stats.cleanup_count;
	const auto after = Sample();
	log(LogLevel::info,
		"Memory cleanup #{}: {:.1f} MB -> {:.1f} MB, evicted {} cache entries",
		_stats.cleanup_count,
		static_cast<double>(used) / kMiB,
		static_cast<double>(after) / kMiB,
		evicted);
	if (after > threshold) {
		log(LogLevel::warning,
			"Memory usage {:.1f} MB is still above the {:.1f} MB threshold, continuing",
			static_cast<double>(after) / kMiB,
			static_cast<double>(threshold) / kMiB);
	}
	return true;
}

MemoryStats MemoryController::stats() const {
	std::lock_guard lock(_mutex);
	return _stats;
}

std::size_t MemoryController::Sample() {
	const auto used = _sampler ? _sampler() : 0;
	_stats.heap_used = used;
	_stats.peak_usage_mb = std::max(_stats.peak_usage_mb, static_cast<double>(used) / kMiB);
	return used;
}

} // namespace sextant
