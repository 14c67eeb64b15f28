// SPDX-License-Identifier: Apache-2.0
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <sextant/config.hpp>
#include <sextant/document.hpp>
#include <sextant/error.hpp>
#include <sextant/external_resolver.hpp>
#include <sextant/log.hpp>
#include <sextant/printer.hpp>
#include <sextant/schema_catalog.hpp>

namespace fs = std::filesystem;
namespace po = ::boost::program_options;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void OnInterrupt(int) { interrupted = 1; }

sextant::LogLevel LogLevelFromString(std::string_view level) {
	if (level == "debug") {
		return sextant::LogLevel::debug;
	}
	if (level == "info") {
		return sextant::LogLevel::info;
	}
	if (level == "error") {
		return sextant::LogLevel::error;
	}
	if (level == "off") {
		return sextant::LogLevel::off;
	}
	return sextant::LogLevel::warning;
}

void PrintMetrics(const sextant::CatalogMetrics& m) {
	std::cout << fmt::format("schemas resolved:    {}\n", m.schemas_resolved)
			  << fmt::format("operations resolved: {}\n", m.operations_resolved)
			  << fmt::format("batches:             {}\n", m.batches)
			  << fmt::format("peak in flight:      {}\n", m.peak_in_flight)
			  << fmt::format("cache:               {} hits, {} misses, {} evictions, hit rate {:.2f}\n",
					 m.cache.hits,
					 m.cache.misses,
					 m.cache.evictions,
					 m.cache.hit_rate)
			  << fmt::format("peak memory:         {:.1f} MiB, {} cleanups\n", m.memory.peak_usage_mb, m.memory.cleanup_count)
			  << fmt::format("elapsed:             {} ms\n", m.elapsed.count());
}

} // namespace

int main(int argc, char* argv[]) try {
	fs::path input;
	fs::path config_file;
	fs::path output;
	std::string level;
	po::options_description desc("sextant-cli");
	auto opts = desc.add_options();
	opts("input,i", po::value<fs::path>(&input), "Path to the OpenAPI document (JSON or YAML).");
	opts("config,c", po::value<fs::path>(&config_file), "Path to an INI-style config file.");
	opts("dump,d", "Print every resolved schema and operation as an indented tree.");
	opts("output,o", po::value<fs::path>(&output), "Write the dump to this file instead of stdout.");
	opts("log-level", po::value<std::string>(&level)->default_value("warning"), "debug, info, warning, error or off.");
	opts("help,h", "Print this help message.");
	desc.add(sextant::config_options());

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);
	if (vm.count("help") || !vm.count("input")) {
		std::cout << desc << std::endl;
		return 1;
	}
	if (vm.count("config")) {
		sextant::load_config_file(config_file, desc, vm);
	}
	sextant::set_log_level(LogLevelFromString(level));

	const auto config = sextant::config_from(vm);
	const auto doc = sextant::load_document(input);

	std::stop_source stop;
	std::signal(SIGINT, OnInterrupt);

	sextant::CatalogBuilder builder(config, std::make_shared<sextant::FileExternalResolver>());
	builder.on_batch([&stop](std::size_t done, std::size_t total) {
		sextant::log(sextant::LogLevel::debug, "{}/{} schemas", done, total);
		if (interrupted) {
			stop.request_stop();
		}
	});

	sextant::CatalogPtr catalog;
	try {
		catalog = builder.build(doc, stop.get_token());
	} catch (const sextant::CancelledError& e) {
		std::cerr << e.formatted() << std::endl;
		std::cerr << fmt::format("{} schemas were resolved before the interrupt.", e.partial()->schemas.size()) << std::endl;
		return 2;
	}

	std::cout << fmt::format("{}: {} schemas, {} operations, {} tags",
					 input.string(),
					 catalog->schemas.size(),
					 catalog->operations.size(),
					 catalog->tags.size())
			  << std::endl;

	if (vm.count("dump")) {
		if (vm.count("output")) {
			sextant::Printer p(output);
			sextant::PrintCatalog(p, *catalog);
		} else {
			sextant::Printer p(std::cout);
			sextant::PrintCatalog(p, *catalog);
		}
	}

	if (const auto metrics = builder.metrics()) {
		PrintMetrics(*metrics);
	}
	return 0;
} catch (const sextant::Error& e) {
	std::cerr << e.formatted() << std::endl;
	return 2;
} catch (const std::exception& e) {
	std::cerr << e.what() << std::endl;
	return 2;
}
