// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "document.hpp"
#include "external_resolver.hpp"
#include "raw_node.hpp"

namespace sextant {

// A "$ref" value. Local references start with "#/", anything else names another document.
struct SchemaReference {
	std::string pointer;

	bool is_local() const noexcept { return pointer.starts_with("#/"); }
	bool has_fragment() const noexcept { return pointer.find('#') != std::string::npos; }

	// Document part, empty for local references.
	std::string_view location() const noexcept {
		return std::string_view(pointer).substr(0, pointer.find('#'));
	}

	// JSON pointer after the '#', e.g. "/components/schemas/Pet".
	std::string_view fragment() const noexcept {
		const auto hash = pointer.find('#');
		return hash == std::string::npos ? std::string_view() : std::string_view(pointer).substr(hash + 1);
	}

	// Decoded last segment, the schema name for "#/components/schemas/<name>".
	std::string name() const;
};

// Walks a JSON pointer fragment from `root`. Throws ReferenceNotFoundError naming the first
// segment that does not exist; `pointer` is only used in the error.
const RawNode& resolve_pointer(const RawNode& root, std::string_view fragment, const std::string& pointer);

// The references currently being resolved, innermost last. One instance per top-level
// resolution; never shared between threads.
class VisitedSet {
public:
	struct Frame {
		std::string key;
		// The $ref as written, used in error chains.
		std::string pointer;
		// Structural nesting (properties, items, additionalProperties) when the frame was entered.
		std::size_t level;
		// False for inline allOf compositions, which take part in back-edges but not in error chains.
		bool reference = true;
	};

	// Pops the frame it was created for.
	class Guard {
	public:
		Guard() noexcept = default;
		Guard(VisitedSet* set) noexcept
			: _set(set) {}
		Guard(const Guard&) = delete;
		Guard& operator=(const Guard&) = delete;
		Guard(Guard&& other) noexcept
			: _set(std::exchange(other._set, nullptr)) {}
		Guard& operator=(Guard&& other) noexcept {
			if (this != &other) {
				release();
				_set = std::exchange(other._set, nullptr);
			}
			return *this;
		}
		~Guard() { release(); }

		void release() noexcept {
			if (_set != nullptr) {
				_set->_frames.pop_back();
				_set = nullptr;
			}
		}

	private:
		VisitedSet* _set = nullptr;
	};

	[[nodiscard]] Guard push(std::string key, std::string pointer, std::size_t level, bool reference = true);

	bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
	// Innermost frame for `key`, nullptr if it is not on the stack.
	const Frame* find(std::string_view key) const noexcept;

	// Reference pointers from the innermost occurrence of `key` to the top of the stack, followed by `pointer`.
	std::vector<std::string> chain_to(std::string_view key, const std::string& pointer) const;

	const std::vector<Frame>& frames() const noexcept { return _frames; }
	std::size_t size() const noexcept { return _frames.size(); }
	bool empty() const noexcept { return _frames.empty(); }

	// Smallest stack index any back-edge has targeted so far; size_t max if none.
	std::size_t lowest_link() const noexcept { return _lowest_link; }
	void record_link(std::size_t index) noexcept;
	void reset_lowest_link(std::size_t value) noexcept { _lowest_link = value; }
	std::size_t index_of(const Frame* frame) const noexcept { return static_cast<std::size_t>(frame - _frames.data()); }

private:
	std::vector<Frame> _frames;
	std::size_t _lowest_link = static_cast<std::size_t>(-1);
};

// A followed reference. Holding it keeps the reference on the visited stack.
struct ResolvedRef {
	const RawNode* node = nullptr;
	// Document that owns `node`; local references inside it resolve against it.
	DocumentPtr document;
	// "<document source>#<canonical pointer>", unique across documents.
	std::string key;
	std::string name;
	VisitedSet::Guard guard;
};

class ReferenceResolver {
public:
	ReferenceResolver();
	explicit ReferenceResolver(std::shared_ptr<ExternalResolver> external,
		std::chrono::milliseconds timeout = std::chrono::seconds(30));

	// Canonical cache and cycle key of `ref` as seen from `doc`.
	std::string key_of(const Document& doc, const SchemaReference& ref) const;

	// Follows `ref` and pushes it onto `visited`. Throws CircularReferenceError when the key is
	// already on the stack, ReferenceNotFoundError, or ExternalReferenceError.
	ResolvedRef resolve(const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level = 0) const;

	// Follows `ref` again while an outer frame for it is on the stack, pushing a new innermost
	// frame at `level`. Throws CircularReferenceError unless that frame is shallower than `level`.
	ResolvedRef reenter(const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level) const;

	const std::shared_ptr<ExternalResolver>& external() const noexcept { return _external; }

private:
	ResolvedRef Follow(const DocumentPtr& doc, const SchemaReference& ref, VisitedSet& visited, std::size_t level, std::string key) const;
	ResolvedRef ResolveExternal(const DocumentPtr& doc, const SchemaReference& ref) const;

	std::shared_ptr<ExternalResolver> _external;
	std::chrono::milliseconds _timeout;
};

} // namespace sextant
