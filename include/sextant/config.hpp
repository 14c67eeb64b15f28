// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#include <boost/program_options.hpp>

#include "memory_controller.hpp"
#include "resolution_cache.hpp"
#include "schema_composer.hpp"

namespace sextant {

// Everything one catalog run can be tuned with. All fields have working defaults.
struct Config {
	bool caching_enabled = true;
	std::size_t cache_max_size = 500;
	bool memory_optimization_enabled = false;
	std::size_t memory_threshold_bytes = std::size_t(2) << 30;
	bool streaming_mode_enabled = false;
	std::size_t batch_size = 10;
	std::size_t worker_threads = 1;
	bool metrics_enabled = false;
	std::size_t max_depth = 100;
	std::chrono::milliseconds external_timeout = std::chrono::seconds(30);

	// Throws std::invalid_argument on values the run cannot work with.
	void validate() const;

	CacheOptions cache_options() const noexcept;
	MemoryOptions memory_options() const noexcept;
	ComposerOptions composer_options() const noexcept;
};

// One option per Config field, usable on the command line and in config files.
boost::program_options::options_description config_options();

// Reads the fields registered by config_options(); unset options keep their defaults.
// The result is validated.
Config config_from(const boost::program_options::variables_map& vm);

// Merges an INI-style file into `vm`. Values already given on the command line win.
void load_config_file(const std::filesystem::path& path,
	const boost::program_options::options_description& desc,
	boost::program_options::variables_map& vm);

} // namespace sextant
