// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "document.hpp"
#include "external_resolver.hpp"
#include "memory_controller.hpp"
#include "openapi.hpp"
#include "resolution_cache.hpp"
#include "resolved_schema.hpp"

namespace sextant {

struct ParameterInfo {
	std::string name;
	std::string location; // "in": path, query, header or cookie
	bool required = false;
	SchemaPtr schema;
};

struct MediaSchema {
	std::string media_type;
	SchemaPtr schema;
};

struct RequestBodyInfo {
	bool required = false;
	std::vector<MediaSchema> content;
};

struct ResponseInfo {
	std::string status;
	std::string description;
	std::vector<MediaSchema> content;
};

struct OperationInfo {
	RequestMethod method = RequestMethod::UNKNOWN;
	std::string path;
	// Declared operationId, or one synthesized from method and path.
	std::string operation_id;
	std::vector<std::string> tags;
	std::string summary;
	bool deprecated = false;
	std::vector<ParameterInfo> parameters;
	std::optional<RequestBodyInfo> request_body;
	std::vector<ResponseInfo> responses;
};

// Every resolved named schema in declaration order, the operations in document order and
// the sorted set of tags. Read-only once built.
struct SchemaCatalog {
	std::vector<std::pair<std::string, SchemaPtr>> schemas;
	std::vector<std::string> tags;
	std::vector<OperationInfo> operations;

	SchemaPtr find(std::string_view name) const noexcept;
};

using CatalogPtr = std::shared_ptr<const SchemaCatalog>;

struct CatalogMetrics {
	CacheStats cache;
	MemoryStats memory;
	std::size_t schemas_resolved = 0;
	std::size_t operations_resolved = 0;
	std::size_t batches = 0;
	// Most top-level resolutions running at the same time.
	std::size_t peak_in_flight = 0;
	std::chrono::milliseconds elapsed{0};
};

// Drives one catalog run: owns the cache, the memory controller and the metrics of that run.
class CatalogBuilder {
public:
	// Called after every batch with the number of schemas done so far and the total.
	using BatchObserver = std::function<void(std::size_t done, std::size_t total)>;

	CatalogBuilder();
	explicit CatalogBuilder(Config config,
		std::shared_ptr<ExternalResolver> external = nullptr,
		MemoryController::Sampler sampler = ResidentMemoryBytes);
	CatalogBuilder(const CatalogBuilder&) = delete;
	CatalogBuilder& operator=(const CatalogBuilder&) = delete;

	// Resolves every named schema and operation of `doc`. Throws CatalogError with every failure
	// found, or CancelledError carrying the schemas finished before the stop was seen.
	CatalogPtr build(const DocumentPtr& doc, std::stop_token stop = {});

	void on_batch(BatchObserver observer) { _observer = std::move(observer); }

	// Metrics of the last build; empty unless metrics are enabled.
	std::optional<CatalogMetrics> metrics() const;

	const Config& config() const noexcept { return _config; }
	ResolutionCache& cache() noexcept { return _cache; }
	MemoryController& memory() noexcept { return _memory; }

private:
	Config _config;
	std::shared_ptr<ExternalResolver> _external;
	ResolutionCache _cache;
	MemoryController _memory;
	BatchObserver _observer;
	CatalogMetrics _metrics;
};

} // namespace sextant
