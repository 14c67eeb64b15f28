// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "memo.hpp"
#include "resolved_schema.hpp"

namespace sextant {

struct CacheOptions {
	bool enabled = true;
	std::size_t max_size = 500;
};

struct CacheStats {
	std::uint64_t hits = 0;
	std::uint64_t misses = 0;
	std::uint64_t evictions = 0;
	std::size_t size = 0;
	std::size_t max_size = 0;
	double hit_rate = 0.0;
};

// LRU store of resolved schemas keyed by canonical reference or composition signature.
// Thread-safe; concurrent requests for the same key compute it once.
class ResolutionCache {
public:
	using Usable = ResolutionMemo::Usable;
	using Compute = ResolutionMemo::Compute;

	ResolutionCache();
	explicit ResolutionCache(CacheOptions options);
	ResolutionCache(const ResolutionCache&) = delete;
	ResolutionCache& operator=(const ResolutionCache&) = delete;

	// Applies new options; shrinking max_size evicts immediately.
	void configure(CacheOptions options);
	CacheOptions options() const;

	// `compute` returns either a SchemaPtr (always stored) or a Computed.
	template <typename Fn>
	SchemaPtr get_or_compute(const std::string& key, Fn&& compute) {
		using Result = std::invoke_result_t<Fn&>;
		return lookup_or_compute(key, {}, [&]() -> Computed {
			if constexpr (std::is_same_v<std::decay_t<Result>, Computed>) {
				return compute();
			} else {
				return Computed{SchemaPtr(compute()), true, nullptr};
			}
		}).value;
	}

	// Empty `usable` accepts every stored entry.
	Computed lookup_or_compute(const std::string& key, const Usable& usable, const Compute& compute);

	CacheStats stats() const;
	std::size_t size() const;
	// Sum of the stored schemas' size hints.
	std::size_t weight() const;

	void clear();
	// Drops least recently used entries until at most `entries` remain. Returns how many went.
	std::size_t evict_to(std::size_t entries);

private:
	struct Entry {
		std::string key;
		Computed value;
		std::size_t size_hint;
	};

	struct InFlight {
		std::thread::id owner;
		bool done = false;
		std::optional<Computed> result;
	};

	std::optional<Computed> Find(const std::string& key, const Usable& usable);
	void Store(const std::string& key, const Computed& value);
	bool WouldDeadlock(const InFlight& flight) const;
	std::size_t EvictTo(std::size_t entries);

	CacheOptions _options;
	mutable std::mutex _mutex;
	std::condition_variable _cv;
	std::list<Entry> _lru; // most recent first
	std::unordered_map<std::string, std::list<Entry>::iterator> _index;
	std::unordered_map<std::string, std::shared_ptr<InFlight>> _inflight;
	std::unordered_map<std::thread::id, std::string> _waiting_on;
	std::size_t _weight = 0;
	std::uint64_t _hits = 0;
	std::uint64_t _misses = 0;
	std::uint64_t _evictions = 0;
};

// Adapts the cache to the composer's memo seam.
class CacheMemo final : public ResolutionMemo {
public:
	explicit CacheMemo(ResolutionCache& cache)
		: _cache(cache) {}

	Computed memoize(const std::string& key, const Usable& usable, const Compute& compute) override {
		return _cache.lookup_or_compute(key, usable, compute);
	}

private:
	ResolutionCache& _cache;
};

} // namespace sextant
