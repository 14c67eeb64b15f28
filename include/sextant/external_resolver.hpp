// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "document.hpp"
#include "raw_node.hpp"

namespace sextant {

// The document that contains the reference being followed.
struct BaseContext {
	DocumentPtr document;
};

// A node inside an externally loaded document. The document keeps the node alive.
struct ExternalSchema {
	DocumentPtr document;
	const RawNode* node = nullptr;
};

// Boundary to whatever can fetch documents that are not the one being resolved.
// Implementations may complete the future on another thread; the caller bounds the wait.
class ExternalResolver {
public:
	virtual ~ExternalResolver() = default;

	// `pointer` is the full $ref value, e.g. "common.yaml#/components/schemas/Error".
	virtual std::future<ExternalSchema> resolve_external(const std::string& pointer, const BaseContext& base) = 0;
};

bool IsHttpUrl(std::string_view location) noexcept;

// Resolves the document part of an external reference against the referencing document:
// URLs are kept, relative file paths are taken from the base document's directory.
std::string canonical_location(std::string_view location, std::string_view base_source);

// Loads file references. Network references are checked against the allowed domains and then
// refused, since no transport ships with the library.
class FileExternalResolver final : public ExternalResolver {
public:
	struct Options {
		// Empty allows every domain.
		std::vector<std::string> allowed_domains;
		std::size_t max_cache_size = 100;
		bool validate = true;
	};

	FileExternalResolver();
	explicit FileExternalResolver(Options options);

	std::future<ExternalSchema> resolve_external(const std::string& pointer, const BaseContext& base) override;

	std::size_t cached_documents() const;
	void clear_cache();

private:
	ExternalSchema Resolve(const std::string& pointer, const BaseContext& base);
	DocumentPtr Load(const std::string& location);
	void CheckDomain(const std::string& pointer, std::string_view url) const;

	Options _options;
	mutable std::mutex _mutex;
	// Oldest first.
	std::deque<std::pair<std::string, DocumentPtr>> _documents;
};

} // namespace sextant
