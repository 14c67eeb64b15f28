// SPDX-License-Identifier: Apache-2.0
#include <sextant/error.hpp>
#include <sextant/json_pointer.hpp>
#include <sextant/reference_resolver.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>

#include <fmt/format.h>

namespace sextant {

namespace {

std::string DocumentSource(const Document& doc) { return doc.source.empty() ? std::string("<memory>") : doc.source; }

void CheckFormat(const SchemaReference& ref) {
	if (ref.pointer.empty()) {
		throw Error(ErrorCode::invalid_reference_format, "Empty $ref");
	}
	const auto fragment = ref.fragment();
	if (ref.location().empty() && !ref.is_local()) {
		throw Error(ErrorCode::invalid_reference_format,
			fmt::format("Invalid reference format: {} (local references must start with \"#/\")", ref.pointer));
	}
	if (!fragment.empty() && fragment.front() != '/') {
		throw Error(ErrorCode::invalid_reference_format, fmt::format("Invalid reference format: {}", ref.pointer));
	}
}

} // namespace

std::string SchemaReference::name() const { return std::string(JsonPointer(fragment()).back()); }

const RawNode& resolve_pointer(const RawNode& root, std::string_view fragment, const std::string& pointer) {
	const RawNode* node = &root;
	const JsonPointer parsed(fragment);
	for (const auto& token : parsed.tokens()) {
		const RawNode* next = nullptr;
		if (node->is_object()) {
			next = node->find(token);
		} else if (node->is_array()) {
			std::size_t index = 0;
			const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
			if (ec == std::errc() && ptr == token.data() + token.size() && index < node->as_array().size()) {
				next = &node->as_array()[index];
			}
		}
		if (next == nullptr) {
			throw ReferenceNotFoundError(pointer, token);
		}
		node = next;
	}
	return *node;
}

VisitedSet::Guard VisitedSet::push(std::string key, std::string pointer, std::size_t level, bool reference) {
	_frames.push_back(Frame{std::move(key), std::move(pointer), level, reference});
	return Guard(this);
}

const VisitedSet::Frame* VisitedSet::find(std::string_view key) const noexcept {
	const auto it = std::find_if(_frames.rbegin(), _frames.rend(), [&](const Frame& f) { return f.key == key; });
	return it == _frames.rend() ? nullptr : &*it;
}

std::vector<std::string> VisitedSet::chain_to(std::string_view key, const std::string& pointer) const {
	std::vector<std::string> chain;
	const auto* frame = find(key);
	if (frame != nullptr) {
		for (auto cur = _frames.begin() + static_cast<std::ptrdiff_t>(index_of(frame)); cur != _frames.end(); ++cur) {
			if (cur->reference) {
				chain.push_back(cur->pointer);
			}
		}
	}
	chain.push_back(pointer);
	return chain;
}

void VisitedSet::record_link(std::size_t index) noexcept { _lowest_link = std::min(_lowest_link, index); }

ReferenceResolver::ReferenceResolver()
	: ReferenceResolver(nullptr) {}

ReferenceResolver::ReferenceResolver(std::shared_ptr<ExternalResolver> external, std::chrono::milliseconds timeout)
	: _external(std::move(external))
	, _timeout(timeout) {}

std::string ReferenceResolver::key_of(const Document& doc, const SchemaReference& ref) const {
	const auto canonical = JsonPointer(ref.fragment()).str();
	if (ref.is_local()) {
		return fmt::format("{}#{}", DocumentSource(doc), canonical);
	}
	return fmt::format("{}#{}", canonical_location(ref.location(), doc.source), canonical);
}

ResolvedRef ReferenceResolver::resolve(
	const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level) const {
	CheckFormat(ref);

	auto key = key_of(*doc, ref);
	if (visited.contains(key)) {
		throw CircularReferenceError(visited.chain_to(key, ref.pointer));
	}
	return Follow(doc, ref, visited, level, std::move(key));
}

ResolvedRef ReferenceResolver::reenter(
	const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level) const {
	CheckFormat(ref);

	auto key = key_of(*doc, ref);
	const auto* frame = visited.find(key);
	if (frame != nullptr && frame->level >= level) {
		throw CircularReferenceError(visited.chain_to(key, ref.pointer));
	}
	return Follow(doc, ref, visited, level, std::move(key));
}

ResolvedRef ReferenceResolver::Follow(
	const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level, std::string key) const {
	ResolvedRef out;
	if (ref.is_local()) {
		out.node = &resolve_pointer(doc->root, ref.fragment(), ref.pointer);
		out.document = doc;
	} else {
		out = ResolveExternal(doc, ref);
	}
	out.name = ref.name();
	out.guard = visited.push(key, ref.pointer, level);
	out.key = std::move(key);
	return out;
}

ResolvedRef ReferenceResolver::ResolveExternal(const DocumentPtr& doc, const SchemaReference& ref) const {
	if (!_external) {
		throw ExternalReferenceError(ref.pointer, "no external resolver is configured");
	}

	auto future = _external->resolve_external(ref.pointer, BaseContext{doc});
	if (!future.valid()) {
		throw ExternalReferenceError(ref.pointer, "external resolver returned no result");
	}
	if (future.wait_for(_timeout) == std::future_status::timeout) {
		throw ExternalReferenceError(ref.pointer,
			fmt::format("timed out after {} ms", _timeout.count()),
			nullptr,
			ErrorCode::external_reference_timeout);
	}

	ExternalSchema external;
	try {
		external = future.get();
	} catch (const ExternalReferenceError&) {
		throw;
	} catch (const std::exception& e) {
		throw ExternalReferenceError(ref.pointer, e.what(), std::current_exception());
	}
	if (external.node == nullptr || !external.document) {
		throw ExternalReferenceError(ref.pointer, "external resolver returned an empty schema");
	}

	ResolvedRef out;
	out.node = external.node;
	out.document = std::move(external.document);
	return out;
}

} // namespace sextant
