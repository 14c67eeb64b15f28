// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "document.hpp"
#include "memo.hpp"
#include "raw_node.hpp"
#include "reference_resolver.hpp"
#include "resolved_schema.hpp"

namespace sextant {

struct ComposerOptions {
	// Limit on nested properties, items, additionalProperties and union variants,
	// independent of cycle detection. Reference hops are not counted.
	std::size_t max_depth = 100;
};

// State of one top-level resolution. Every recursive step threads the same instance;
// independent top-level schemas each get their own.
struct ResolutionContext {
	explicit ResolutionContext(DocumentPtr doc)
		: document(std::move(doc)) {}

	DocumentPtr document;
	VisitedSet visited;
	// Reference keys expanded so far, in order; duplicates allowed.
	std::vector<std::string> expanded;
	std::size_t depth = 0;
};

// Turns raw schema nodes into ResolvedSchema trees: follows $ref, merges allOf,
// builds oneOf/anyOf unions and recurses into properties, items and additionalProperties.
class SchemaComposer {
public:
	explicit SchemaComposer(const ReferenceResolver& resolver, ResolutionMemo* memo = nullptr, ComposerOptions options = {});

	// Resolves components.schemas.<name>.
	SchemaPtr resolve_named(const DocumentPtr& doc, std::string_view name) const;

	// Resolves an inline node or $ref of `doc`. `path` locates the node for error messages.
	SchemaPtr resolve_schema(const DocumentPtr& doc, const RawNode& node, const std::string& path = {}) const;
	SchemaPtr resolve_schema(ResolutionContext& ctx, const RawNode& node, const std::string& path = {}) const;

	const ComposerOptions& options() const noexcept { return _options; }

private:
	SchemaPtr Resolve(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path,
		bool inline_node = true) const;
	SchemaPtr ResolveNested(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path) const;
	SchemaPtr ExpandBackEdge(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path) const;
	SchemaPtr ResolveRef(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path) const;
	SchemaPtr ResolveAllOf(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path) const;
	SchemaPtr ResolveUnion(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::string_view keyword,
		std::size_t level,
		const std::string& path) const;
	SchemaPtr ResolvePlain(ResolutionContext& ctx,
		const DocumentPtr& doc,
		const RawNode& node,
		std::size_t level,
		const std::string& path) const;

	template <typename Fn>
	SchemaPtr Memoized(ResolutionContext& ctx, const std::string& key, std::size_t scope, Fn&& compute) const;

	const ReferenceResolver& _resolver;
	ResolutionMemo* _memo;
	ComposerOptions _options;
};

} // namespace sextant
