// SPDX-License-Identifier: Apache-2.0
#include <sextant/error.hpp>
#include <sextant/external_resolver.hpp>
#include <sextant/log.hpp>
#include <sextant/reference_resolver.hpp>

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace sextant {

namespace {

std::string_view HostOf(std::string_view url) noexcept {
	const auto scheme = url.find("://");
	if (scheme == std::string_view::npos) {
		return {};
	}
	url.remove_prefix(scheme + 3);
	if (const auto at = url.find('@'); at != std::string_view::npos && at < url.find('/')) {
		url.remove_prefix(at + 1);
	}
	return url.substr(0, url.find_first_of(":/?#"));
}

} // namespace

bool IsHttpUrl(std::string_view location) noexcept {
	return location.starts_with("http://") || location.starts_with("https://");
}

std::string canonical_location(std::string_view location, std::string_view base_source) {
	if (IsHttpUrl(location)) {
		return std::string(location);
	}
	fs::path path(location);
	if (path.is_relative() && !IsHttpUrl(base_source) && !base_source.empty() && base_source.front() != '<') {
		path = fs::path(base_source).parent_path() / path;
	}
	return path.lexically_normal().generic_string();
}

FileExternalResolver::FileExternalResolver()
	: FileExternalResolver(Options{}) {}

FileExternalResolver::FileExternalResolver(Options options)
	: _options(std::move(options)) {}

std::future<ExternalSchema> FileExternalResolver::resolve_external(const std::string& pointer, const BaseContext& base) {
	// Loading is synchronous, the future is ready on return.
	std::promise<ExternalSchema> promise;
	try {
		promise.set_value(Resolve(pointer, base));
	} catch (...) {
		promise.set_exception(std::current_exception());
	}
	return promise.get_future();
}

std::size_t FileExternalResolver::cached_documents() const {
	std::lock_guard lock(_mutex);
	return _documents.size();
}

void FileExternalResolver::clear_cache() {
	std::lock_guard lock(_mutex);
	_documents.clear();
}

ExternalSchema FileExternalResolver::Resolve(const std::string& pointer, const BaseContext& base) {
	const SchemaReference ref{pointer};
	if (!ref.has_fragment()) {
		throw Error(ErrorCode::invalid_reference_format, fmt::format("Invalid external reference format: {}", pointer));
	}

	const auto base_source = base.document ? std::string_view(base.document->source) : std::string_view();
	const auto location = canonical_location(ref.location(), base_source);
	if (IsHttpUrl(location)) {
		CheckDomain(pointer, location);
		throw ExternalReferenceError(pointer, fmt::format("No transport available to fetch {}", location));
	}

	auto document = Load(location);
	const auto& node = resolve_pointer(document->root, ref.fragment(), pointer);
	return ExternalSchema{std::move(document), &node};
}

DocumentPtr FileExternalResolver::Load(const std::string& location) {
	{
		std::lock_guard lock(_mutex);
		const auto it = std::find_if(
			_documents.begin(), _documents.end(), [&](const auto& entry) { return entry.first == location; });
		if (it != _documents.end()) {
			return it->second;
		}
	}

	// Parsed outside the lock; a concurrent load of the same file only costs a second parse.
	auto document = load_document(location, _options.validate);

	std::lock_guard lock(_mutex);
	const auto it = std::find_if(
		_documents.begin(), _documents.end(), [&](const auto& entry) { return entry.first == location; });
	if (it != _documents.end()) {
		return it->second;
	}
	if (_options.max_cache_size == 0) {
		return document;
	}
	while (_documents.size() >= _options.max_cache_size) {
		_documents.pop_front();
	}
	_documents.emplace_back(location, document);
	log(LogLevel::debug, "Cached external document {}", location);
	return document;
}

void FileExternalResolver::CheckDomain(const std::string& pointer, std::string_view url) const {
	if (_options.allowed_domains.empty()) {
		return;
	}
	const auto host = HostOf(url);
	const bool allowed =
		std::any_of(_options.allowed_domains.begin(), _options.allowed_domains.end(), [&](const std::string& domain) {
			return host == domain || (host.size() > domain.size() && host.ends_with(domain) &&
										 host[host.size() - domain.size() - 1] == '.');
		});
	if (!allowed) {
		throw ExternalReferenceError(
			pointer, fmt::format("Domain not allowed: {}", host), nullptr, ErrorCode::domain_not_allowed);
	}
}

} // namespace sextant
