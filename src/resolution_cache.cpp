// SPDX-License-Identifier: Apache-2.0
#include <sextant/log.hpp>
#include <sextant/resolution_cache.hpp>

namespace sextant {

ResolutionCache::ResolutionCache()
	: ResolutionCache(CacheOptions{}) {}

ResolutionCache::ResolutionCache(CacheOptions options)
	: _options(options) {}

void ResolutionCache::configure(CacheOptions options) {
	std::lock_guard lock(_mutex);
	_options = options;
	if (!_options.enabled) {
		EvictTo(0);
	} else {
		EvictTo(_options.max_size);
	}
}

CacheOptions ResolutionCache::options() const {
	std::lock_guard lock(_mutex);
	return _options;
}

Computed ResolutionCache::lookup_or_compute(const std::string& key, const Usable& usable, const Compute& compute) {
	std::unique_lock lock(_mutex);
	if (!_options.enabled) {
		++_misses;
		lock.unlock();
		return compute();
	}

	const auto me = std::this_thread::get_id();
	while (true) {
		if (auto found = Find(key, usable)) {
			++_hits;
			return std::move(*found);
		}
		const auto it = _inflight.find(key);
		if (it == _inflight.end()) {
			break;
		}
		auto flight = it->second;
		if (WouldDeadlock(*flight)) {
			// The owner is (transitively) waiting for us; compute on our own and keep it out of the store.
			++_misses;
			lock.unlock();
			auto result = compute();
			result.cacheable = false;
			return result;
		}
		_waiting_on[me] = key;
		_cv.wait(lock, [&] { return flight->done; });
		_waiting_on.erase(me);
		if (flight->result && (!usable || !flight->result->dependencies || usable(*flight->result->dependencies))) {
			++_hits;
			return *flight->result;
		}
		// Failed, not cacheable, or not usable here: look again and compute if nobody else is.
	}

	auto flight = std::make_shared<InFlight>();
	flight->owner = me;
	_inflight.emplace(key, flight);
	++_misses;
	lock.unlock();

	Computed result;
	try {
		result = compute();
	} catch (...) {
		lock.lock();
		flight->done = true;
		_inflight.erase(key);
		_cv.notify_all();
		throw;
	}

	lock.lock();
	if (result.cacheable && result.value) {
		Store(key, result);
		flight->result = result;
	}
	flight->done = true;
	_inflight.erase(key);
	_cv.notify_all();
	return result;
}

CacheStats ResolutionCache::stats() const {
	std::lock_guard lock(_mutex);
	CacheStats s;
	s.hits = _hits;
	s.misses = _misses;
	s.evictions = _evictions;
	s.size = _lru.size();
	s.max_size = _options.max_size;
	const auto total = _hits + _misses;
	s.hit_rate = total == 0 ? 0.0 : static_cast<double>(_hits) / static_cast<double>(total);
	return s;
}

std::size_t ResolutionCache::size() const {
	std::lock_guard lock(_mutex);
	return _lru.size();
}

std::size_t ResolutionCache::weight() const {
	std::lock_guard lock(_mutex);
	return _weight;
}

void ResolutionCache::clear() {
	std::lock_guard lock(_mutex);
	_lru.clear();
	_index.clear();
	_weight = 0;
	_hits = 0;
	_misses = 0;
	_evictions = 0;
}

std::size_t ResolutionCache::evict_to(std::size_t entries) {
	std::lock_guard lock(_mutex);
	return EvictTo(entries);
}

std::optional<Computed> ResolutionCache::Find(const std::string& key, const Usable& usable) {
	const auto it = _index.find(key);
	if (it == _index.end()) {
		return std::nullopt;
	}
	const auto& deps = it->second->value.dependencies;
	if (usable && deps && !usable(*deps)) {
		return std::nullopt;
	}
	_lru.splice(_lru.begin(), _lru, it->second);
	return it->second->value;
}

void ResolutionCache::Store(const std::string& key, const Computed& value) {
	const auto hint = value.value->size_hint();
	if (const auto it = _index.find(key); it != _index.end()) {
		_weight = _weight - it->second->size_hint + hint;
		it->second->value = value;
		it->second->size_hint = hint;
		_lru.splice(_lru.begin(), _lru, it->second);
		return;
	}
	if (_options.max_size == 0) {
		return;
	}
	EvictTo(_options.max_size - 1);
	_lru.push_front(Entry{key, value, hint});
	_index.emplace(key, _lru.begin());
	_weight += hint;
}

bool ResolutionCache::WouldDeadlock(const InFlight& flight) const {
	const auto me = std::this_thread::get_id();
	auto owner = flight.owner;
	for (std::size_t hops = 0; hops <= _waiting_on.size(); ++hops) {
		if (owner == me) {
			return true;
		}
		const auto waiting = _waiting_on.find(owner);
		if (waiting == _waiting_on.end()) {
			return false;
		}
		const auto next = _inflight.find(waiting->second);
		if (next == _inflight.end()) {
			return false;
		}
		owner = next->second->owner;
	}
	return false;
}

std::size_t ResolutionCache::EvictTo(std::size_t entries) {
	std::size_t evicted = 0;
	while (_lru.size() > entries) {
		auto& victim = _lru.back();
		_weight -= victim.size_hint;
		_index.erase(victim.key);
		_lru.pop_back();
		++evicted;
	}
	_evictions += evicted;
	if (evicted != 0) {
		log(LogLevel::debug, "Evicted {} cache entries, {} left", evicted, _lru.size());
	}
	return evicted;
}

} // namespace sextant
