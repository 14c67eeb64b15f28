// SPDX-License-Identifier: Apache-2.0
#include <sextant/config.hpp>

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

namespace po = ::boost::program_options;

namespace sextant {

void Config::validate() const {
	if (caching_enabled && cache_max_size == 0) {
		throw std::invalid_argument("cache-max-size must be positive when caching is enabled");
	}
	if (batch_size == 0) {
		throw std::invalid_argument("batch-size must be positive");
	}
	if (worker_threads == 0) {
		throw std::invalid_argument("workers must be positive");
	}
	if (max_depth == 0) {
		throw std::invalid_argument("max-depth must be positive");
	}
	if (memory_optimization_enabled && memory_threshold_bytes == 0) {
		throw std::invalid_argument("memory-threshold must be positive when memory optimization is enabled");
	}
	if (external_timeout.count() <= 0) {
		throw std::invalid_argument("external-timeout-ms must be positive");
	}
}

CacheOptions Config::cache_options() const noexcept { return CacheOptions{caching_enabled, cache_max_size}; }

MemoryOptions Config::memory_options() const noexcept {
	MemoryOptions options;
	options.enabled = memory_optimization_enabled;
	options.threshold_bytes = memory_threshold_bytes;
	options.streaming_mode = streaming_mode_enabled;
	options.batch_size = batch_size;
	return options;
}

ComposerOptions Config::composer_options() const noexcept { return ComposerOptions{max_depth}; }

po::options_description config_options() {
	const Config defaults;
	po::options_description desc("Resolution options");
	auto opts = desc.add_options();
	opts("cache", po::value<bool>()->default_value(defaults.caching_enabled), "Cache resolved schemas.");
	opts("cache-max-size",
		po::value<std::size_t>()->default_value(defaults.cache_max_size),
		"Maximum number of cached schemas.");
	opts("memory-optimization",
		po::value<bool>()->default_value(defaults.memory_optimization_enabled),
		"Evict the cache when memory usage crosses the threshold.");
	opts("memory-threshold",
		po::value<std::size_t>()->default_value(defaults.memory_threshold_bytes),
		"Memory threshold in bytes.");
	opts("streaming",
		po::value<bool>()->default_value(defaults.streaming_mode_enabled),
		"Resolve schemas in fixed-size batches.");
	opts("batch-size", po::value<std::size_t>()->default_value(defaults.batch_size), "Schemas per batch.");
	opts("workers", po::value<std::size_t>()->default_value(defaults.worker_threads), "Worker threads.");
	opts("metrics", po::value<bool>()->default_value(defaults.metrics_enabled), "Collect and print run metrics.");
	opts("max-depth",
		po::value<std::size_t>()->default_value(defaults.max_depth),
		"Maximum schema nesting depth.");
	opts("external-timeout-ms",
		po::value<long long>()->default_value(defaults.external_timeout.count()),
		"Timeout for external references in milliseconds.");
	return desc;
}

Config config_from(const po::variables_map& vm) {
	Config config;
	const auto read = [&vm]<typename T>(const char* name, T& field) {
		if (vm.count(name)) {
			field = vm[name].as<T>();
		}
	};
	read("cache", config.caching_enabled);
	read("cache-max-size", config.cache_max_size);
	read("memory-optimization", config.memory_optimization_enabled);
	read("memory-threshold", config.memory_threshold_bytes);
	read("streaming", config.streaming_mode_enabled);
	read("batch-size", config.batch_size);
	read("workers", config.worker_threads);
	read("metrics", config.metrics_enabled);
	read("max-depth", config.max_depth);
	if (vm.count("external-timeout-ms")) {
		config.external_timeout = std::chrono::milliseconds(vm["external-timeout-ms"].as<long long>());
	}
	config.validate();
	return config;
}

void load_config_file(const std::filesystem::path& path, const po::options_description& desc, po::variables_map& vm) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error(fmt::format("Config file {} cannot be read", path.string()));
	}
	po::store(po::parse_config_file(in, desc), vm);
	po::notify(vm);
}

} // namespace sextant
