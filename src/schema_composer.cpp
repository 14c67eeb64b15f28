// SPDX-License-Identifier: Apache-2.0
#include <sextant/error.hpp>
#include <sextant/json_pointer.hpp>
#include <sextant/schema_composer.hpp>

#include <algorithm>
#include <array>
#include <limits>

#include <fmt/format.h>

namespace sextant {

namespace {

constexpr std::size_t kNoLink = std::numeric_limits<std::size_t>::max();

// Keywords the composer interprets; everything else is a constraint and passes through verbatim.
constexpr std::array<std::string_view, 19> kInterpreted = {"$ref",
	"allOf",
	"oneOf",
	"anyOf",
	"type",
	"format",
	"properties",
	"required",
	"items",
	"additionalProperties",
	"nullable",
	"discriminator",
	"title",
	"description",
	"example",
	"default",
	"deprecated",
	"readOnly",
	"writeOnly"};

bool IsInterpreted(std::string_view key, const RawNode& value) noexcept {
	// The boolean form of additionalProperties is a plain constraint.
	if (key == "additionalProperties" && !value.is_object()) {
		return false;
	}
	return std::find(kInterpreted.begin(), kInterpreted.end(), key) != kInterpreted.end();
}

class DepthGuard {
public:
	DepthGuard(std::size_t& depth, std::size_t limit, const std::string& path)
		: _depth(depth) {
		if (_depth >= limit) {
			RecursionLimitExceededError error(limit);
			error.set_path_if_empty(path.empty() ? std::string_view("/") : std::string_view(path));
			throw error;
		}
		++_depth;
	}
	DepthGuard(const DepthGuard&) = delete;
	DepthGuard& operator=(const DepthGuard&) = delete;
	~DepthGuard() { --_depth; }

private:
	std::size_t& _depth;
};

std::string Child(const std::string& path, std::string_view keyword) { return fmt::format("{}/{}", path, keyword); }

std::string Child(const std::string& path, std::string_view keyword, std::string_view name) {
	return fmt::format("{}/{}/{}", path, keyword, encode_pointer_token(name));
}

std::string Child(const std::string& path, std::string_view keyword, std::size_t index) {
	return fmt::format("{}/{}/{}", path, keyword, index);
}

// Where the target of `ref` lives, for error paths inside it.
std::string TargetPath(const SchemaReference& ref) {
	const auto canonical = JsonPointer(ref.fragment()).str();
	return ref.is_local() ? canonical : fmt::format("{}#{}", ref.location(), canonical);
}

// Frame key of an inline allOf. Document nodes do not move while a document is alive.
std::string CompositionKey(const RawNode& node) { return fmt::format("allOf@{}", static_cast<const void*>(&node)); }

bool IsComponentRef(const SchemaReference& ref) {
	const JsonPointer pointer(ref.fragment());
	return pointer.size() == 3 && pointer.tokens()[0] == "components" && pointer.tokens()[1] == "schemas";
}

bool IsAny(const ResolvedSchema& schema) noexcept {
	const auto* prim = schema.primitive();
	return prim != nullptr && prim->type.empty();
}

SchemaPtr MakeAny() {
	auto schema = std::make_shared<ResolvedSchema>();
	schema->shape = PrimitiveShape{};
	return schema;
}

struct TypeList {
	std::vector<std::string> names;
	bool null = false;
};

// Accepts both `type: X` and the 3.1 form `type: [X, "null"]`.
TypeList ReadTypes(const RawNode& node) {
	TypeList out;
	const auto* type = node.find("type");
	if (type == nullptr) {
		return out;
	}
	if (type->is_string()) {
		out.names.push_back(type->as_string());
	} else if (type->is_array()) {
		for (const auto& t : type->as_array()) {
			if (!t.is_string()) {
				continue;
			}
			if (t.as_string() == "null") {
				out.null = true;
			} else {
				out.names.push_back(t.as_string());
			}
		}
		if (out.names.empty() && out.null) {
			out.names.emplace_back("null");
			out.null = false;
		}
	}
	return out;
}

void ReadMetadata(const RawNode& node, Metadata& meta) {
	meta.title = node.string_or("title");
	meta.description = node.string_or("description");
	if (const auto* example = node.find("example")) {
		meta.example = *example;
	}
	if (const auto* value = node.find("default")) {
		meta.default_value = *value;
	}
	meta.deprecated = node.bool_or("deprecated");
	meta.read_only = node.bool_or("readOnly");
	meta.write_only = node.bool_or("writeOnly");
}

void ReadConstraints(const RawNode& node, RawNode::Object& out) {
	for (const auto& [key, value] : node.as_object()) {
		if (!IsInterpreted(key, value)) {
			out.emplace_back(key, value);
		}
	}
}

// nullable, metadata and constraints, shared by every node shape.
void ReadAnnotations(const RawNode& node, ResolvedSchema& out) {
	out.nullable = node.bool_or("nullable") || ReadTypes(node).null;
	ReadMetadata(node, out.metadata);
	ReadConstraints(node, out.validation_constraints);
}

void MergeMetadata(Metadata& into, const Metadata& from) {
	if (into.title.empty()) {
		into.title = from.title;
	}
	if (into.description.empty()) {
		into.description = from.description;
	}
	if (!into.example) {
		into.example = from.example;
	}
	if (!into.default_value) {
		into.default_value = from.default_value;
	}
	into.deprecated = into.deprecated || from.deprecated;
	into.read_only = into.read_only || from.read_only;
	into.write_only = into.write_only || from.write_only;
}

// Keys keep their first position, values are last-writer-wins.
void MergeConstraints(RawNode::Object& into, const RawNode::Object& from) {
	for (const auto& [key, value] : from) {
		const auto it =
			std::find_if(into.begin(), into.end(), [&key = key](const RawNode::Member& m) { return m.first == key; });
		if (it == into.end()) {
			into.emplace_back(key, value);
		} else {
			it->second = value;
		}
	}
}

bool Compatible(const SchemaPtr& a, const SchemaPtr& b) {
	if (!a || !b || IsAny(*a) || IsAny(*b) || a->recursive() || b->recursive()) {
		return true;
	}
	if (a->kind() != b->kind()) {
		return false;
	}
	if (const auto* prim = a->primitive()) {
		return prim->type == b->primitive()->type;
	}
	if (const auto* arr = a->array()) {
		return Compatible(arr->items, b->array()->items);
	}
	return true;
}

std::string Signature(const SchemaPtr& schema) { return schema ? describe(*schema) : std::string("any"); }

ObjectShape MergeObjects(const std::vector<const ResolvedSchema*>& branches) {
	ObjectShape out;
	for (const auto* branch : branches) {
		const auto& obj = *branch->object();
		for (const auto& prop : obj.properties) {
			const auto it = std::find_if(out.properties.begin(), out.properties.end(), [&](const Property& p) {
				return p.name == prop.name;
			});
			if (it == out.properties.end()) {
				out.properties.push_back(prop);
				continue;
			}
			if (!Compatible(it->schema, prop.schema)) {
				throw SchemaCompositionError("allOf",
					fmt::format("incompatible types for property '{}': {} and {}",
						prop.name,
						Signature(it->schema),
						Signature(prop.schema)));
			}
			it->schema = prop.schema;
			it->required = it->required || prop.required;
		}
		for (const auto& name : obj.required) {
			if (std::find(out.required.begin(), out.required.end(), name) == out.required.end()) {
				out.required.push_back(name);
			}
		}
		if (obj.additional_properties) {
			if (!Compatible(out.additional_properties, obj.additional_properties)) {
				throw SchemaCompositionError("allOf", "incompatible additionalProperties");
			}
			out.additional_properties = obj.additional_properties;
		}
		if (!out.discriminator && obj.discriminator) {
			out.discriminator = obj.discriminator;
		}
	}
	for (auto& prop : out.properties) {
		prop.required = prop.required ||
			std::find(out.required.begin(), out.required.end(), prop.name) != out.required.end();
	}
	return out;
}

SchemaPtr MergeAllOf(const std::vector<SchemaPtr>& branches) {
	auto merged = std::make_shared<ResolvedSchema>();
	merged->composition = Composition::all_of;

	std::vector<const ResolvedSchema*> typed;
	for (const auto& branch : branches) {
		merged->nullable = merged->nullable || branch->nullable;
		MergeMetadata(merged->metadata, branch->metadata);
		MergeConstraints(merged->validation_constraints, branch->validation_constraints);
		if (!IsAny(*branch)) {
			typed.push_back(branch.get());
		}
	}

	if (typed.empty()) {
		merged->shape = PrimitiveShape{};
		return merged;
	}
	const auto all = [&](SchemaKind kind) {
		return std::all_of(typed.begin(), typed.end(), [&](const ResolvedSchema* s) { return s->kind() == kind; });
	};

	if (all(SchemaKind::object)) {
		merged->shape = MergeObjects(typed);
	} else if (typed.size() == 1) {
		// A lone union or recursive branch keeps its shape.
		merged->shape = typed.front()->shape;
	} else if (all(SchemaKind::array)) {
		ArrayShape shape;
		for (const auto* branch : typed) {
			const auto& items = branch->array()->items;
			if (!Compatible(shape.items, items)) {
				throw SchemaCompositionError("allOf", "incompatible base types");
			}
			if (items) {
				shape.items = items;
			}
		}
		merged->shape = std::move(shape);
	} else if (all(SchemaKind::primitive)) {
		PrimitiveShape shape{typed.front()->primitive()->type, {}};
		for (const auto* branch : typed) {
			const auto* prim = branch->primitive();
			if (prim->type != shape.type) {
				throw SchemaCompositionError("allOf", "incompatible base types");
			}
			if (!prim->format.empty()) {
				shape.format = prim->format;
			}
		}
		merged->shape = std::move(shape);
	} else {
		throw SchemaCompositionError("allOf", "incompatible base types");
	}
	return merged;
}

std::optional<Discriminator> ReadDiscriminator(
	const RawNode& node, const Document& doc, const std::vector<SchemaPtr>& variants, std::string_view keyword) {
	const auto* spec = node.find("discriminator");
	if (spec == nullptr || !spec->is_object()) {
		return std::nullopt;
	}
	Discriminator out;
	out.property_name = spec->string_or("propertyName");

	const auto add = [&](const std::string& value, std::string name) {
		const auto dup = std::find_if(
			out.mapping.begin(), out.mapping.end(), [&](const auto& entry) { return entry.first == value; });
		if (dup != out.mapping.end()) {
			throw SchemaCompositionError(std::string(keyword),
				fmt::format("discriminator value '{}' selects both {} and {}", value, dup->second, name),
				ErrorCode::ambiguous_discriminator);
		}
		out.mapping.emplace_back(value, std::move(name));
	};

	const auto* mapping = spec->find("mapping");
	if (mapping != nullptr && mapping->is_object()) {
		for (const auto& [value, target] : mapping->as_object()) {
			if (!target.is_string()) {
				throw SchemaCompositionError(std::string(keyword),
					fmt::format("discriminator mapping for '{}' is not a string", value),
					ErrorCode::ambiguous_discriminator);
			}
			const auto& pointer = target.as_string();
			if (pointer.find('#') != std::string::npos) {
				const SchemaReference ref{pointer};
				if (ref.is_local()) {
					resolve_pointer(doc.root, ref.fragment(), pointer);
				}
				add(value, ref.name());
			} else {
				// A bare name refers to components.schemas.<name>.
				resolve_pointer(doc.root,
					fmt::format("/components/schemas/{}", encode_pointer_token(pointer)),
					fmt::format("#/components/schemas/{}", pointer));
				add(value, pointer);
			}
		}
	} else {
		for (const auto& variant : variants) {
			if (!variant->source_name.empty()) {
				add(variant->source_name, variant->source_name);
			}
		}
	}
	return out;
}

SchemaPtr WithOverrides(SchemaPtr schema, const RawNode& node) {
	Metadata meta;
	ReadMetadata(node, meta);
	const bool nullable = node.bool_or("nullable") && !schema->nullable;
	if (!nullable && meta == Metadata{}) {
		return schema;
	}
	auto copy = std::make_shared<ResolvedSchema>(*schema);
	copy->nullable = copy->nullable || nullable;
	if (!meta.title.empty()) {
		copy->metadata.title = meta.title;
	}
	if (!meta.description.empty()) {
		copy->metadata.description = meta.description;
	}
	if (meta.example) {
		copy->metadata.example = meta.example;
	}
	if (meta.default_value) {
		copy->metadata.default_value = meta.default_value;
	}
	copy->metadata.deprecated = copy->metadata.deprecated || meta.deprecated;
	copy->metadata.read_only = copy->metadata.read_only || meta.read_only;
	copy->metadata.write_only = copy->metadata.write_only || meta.write_only;
	return copy;
}

} // namespace

SchemaComposer::SchemaComposer(const ReferenceResolver& resolver, ResolutionMemo* memo, ComposerOptions options)
	: _resolver(resolver)
	, _memo(memo)
	, _options(options) {}

SchemaPtr SchemaComposer::resolve_named(const DocumentPtr& doc, std::string_view name) const {
	ResolutionContext ctx(doc);
	const auto token = encode_pointer_token(name);
	RawNode ref;
	ref.emplace("$ref", fmt::format("#/components/schemas/{}", token));
	return Resolve(ctx, doc, ref, 0, fmt::format("/components/schemas/{}", token));
}

SchemaPtr SchemaComposer::resolve_schema(const DocumentPtr& doc, const RawNode& node, const std::string& path) const {
	ResolutionContext ctx(doc);
	return resolve_schema(ctx, node, path);
}

SchemaPtr SchemaComposer::resolve_schema(ResolutionContext& ctx, const RawNode& node, const std::string& path) const {
	return Resolve(ctx, ctx.document, node, 0, path);
}

template <typename Fn>
SchemaPtr SchemaComposer::Memoized(ResolutionContext& ctx, const std::string& key, std::size_t scope, Fn&& compute) const {
	bool computed_here = false;
	const auto run = [&]() -> Computed {
		computed_here = true;
		const auto saved_link = ctx.visited.lowest_link();
		ctx.visited.reset_lowest_link(kNoLink);
		const auto mark = ctx.expanded.size();

		SchemaPtr value = compute();

		const auto link = ctx.visited.lowest_link();
		ctx.visited.reset_lowest_link(std::min(saved_link, link));
		auto deps = std::make_shared<Dependencies>(ctx.expanded.begin() + static_cast<std::ptrdiff_t>(mark), ctx.expanded.end());
		std::sort(deps->begin(), deps->end());
		deps->erase(std::unique(deps->begin(), deps->end()), deps->end());
		// A back-edge to a frame outside this scope ties the value to the current stack.
		return Computed{std::move(value), link == kNoLink || link >= scope, std::move(deps)};
	};

	if (_memo == nullptr) {
		return run().value;
	}

	// A stored value that expanded a reference now on our stack would differ from a fresh
	// resolution, which turns that reference into a back-edge or a cycle.
	const auto usable = [&](const Dependencies& deps) {
		return std::none_of(ctx.visited.frames().begin(), ctx.visited.frames().end(), [&](const VisitedSet::Frame& f) {
			return std::binary_search(deps.begin(), deps.end(), f.key);
		});
	};

	auto result = _memo->memoize(key, usable, run);
	if (!computed_here && result.dependencies) {
		ctx.expanded.insert(ctx.expanded.end(), result.dependencies->begin(), result.dependencies->end());
	}
	return result.value;
}

SchemaPtr SchemaComposer::Resolve(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path,
	bool inline_node) const {
	try {
		if (!node.is_object()) {
			if (node.is_bool() && node.as_bool()) {
				return MakeAny();
			}
			throw UnsupportedSchemaShapeError(
				fmt::format("expected a schema object, found {}", to_string(node.type())), ErrorCode::invalid_spec_type);
		}
		if (node.contains("$ref")) {
			return ResolveRef(ctx, doc, node, level, path);
		}

		std::string_view keyword;
		for (const std::string_view candidate : {"allOf", "oneOf", "anyOf"}) {
			if (node.contains(candidate)) {
				keyword = candidate;
				break;
			}
		}
		if (keyword.empty()) {
			return ResolvePlain(ctx, doc, node, level, path);
		}

		if (inline_node && keyword == "allOf") {
			// The same inline allOf met again below a property or items: a recursive type.
			const auto* frame = ctx.visited.find(CompositionKey(node));
			if (frame != nullptr && frame->level < level) {
				ctx.visited.record_link(ctx.visited.index_of(frame));
				auto back_edge = std::make_shared<ResolvedSchema>();
				back_edge->shape = RecursiveShape{std::string(JsonPointer(path).back()), fmt::format("#{}", path)};
				return back_edge;
			}
		}

		const auto compose = [&]() -> SchemaPtr {
			if (keyword == "allOf") {
				return ResolveAllOf(ctx, doc, node, level, path);
			}
			return ResolveUnion(ctx, doc, node, keyword, level, path);
		};
		if (!inline_node || _memo == nullptr) {
			return compose();
		}
		// Structurally identical inline compositions of one document share an entry.
		return Memoized(ctx, fmt::format("inline:{}#{}", doc->source, node.dump()), ctx.visited.size(), compose);
	} catch (Error& e) {
		e.set_path_if_empty(path.empty() ? std::string_view("/") : std::string_view(path));
		throw;
	}
}

SchemaPtr SchemaComposer::ResolveRef(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path) const {
	const auto* target = node.find("$ref");
	if (!target->is_string()) {
		throw Error(ErrorCode::invalid_reference_format, "$ref must be a string");
	}
	const SchemaReference ref{target->as_string()};
	const bool component = IsComponentRef(ref);
	const auto key = _resolver.key_of(*doc, ref);

	SchemaPtr schema;
	const auto* frame = ctx.visited.find(key);
	if (frame != nullptr && frame->level < level) {
		// Reached again below a property, items or additionalProperties: a legal recursive type.
		ctx.visited.record_link(ctx.visited.index_of(frame));
		auto back_edge = std::make_shared<ResolvedSchema>();
		back_edge->shape = RecursiveShape{ref.name(), ref.pointer};
		if (component) {
			back_edge->source_name = ref.name();
		}
		schema = std::move(back_edge);
	} else {
		auto resolved = _resolver.resolve(doc, ref, ctx.visited, level);
		ctx.expanded.push_back(resolved.key);
		const auto scope = ctx.visited.size() - 1;
		const auto target_path = TargetPath(ref);

		schema = Memoized(ctx, resolved.key, scope, [&]() -> SchemaPtr {
			auto value = Resolve(ctx, resolved.document, *resolved.node, level, target_path, false);
			if (component && value->source_name != resolved.name) {
				auto named = std::make_shared<ResolvedSchema>(*value);
				named->source_name = resolved.name;
				value = std::move(named);
			}
			return value;
		});
	}
	return WithOverrides(std::move(schema), node);
}

SchemaPtr SchemaComposer::ResolveNested(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path) const {
	DepthGuard depth(ctx.depth, _options.max_depth, path);
	return Resolve(ctx, doc, node, level, path);
}

SchemaPtr SchemaComposer::ExpandBackEdge(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path) const {
	const auto* target = node.is_object() ? node.find("$ref") : nullptr;
	if (target == nullptr || !target->is_string()) {
		return nullptr;
	}
	const SchemaReference ref{target->as_string()};
	const auto* frame = ctx.visited.find(_resolver.key_of(*doc, ref));
	if (frame == nullptr || frame->level >= level) {
		return nullptr;
	}

	// A base still being resolved further up: merge its own keywords here, so references
	// inside its properties come back as back-edges.
	ctx.visited.record_link(ctx.visited.index_of(frame));
	auto resolved = _resolver.reenter(doc, ref, ctx.visited, level);
	ctx.expanded.push_back(resolved.key);
	try {
		return WithOverrides(Resolve(ctx, resolved.document, *resolved.node, level, TargetPath(ref), false), node);
	} catch (Error& e) {
		e.set_path_if_empty(path);
		throw;
	}
}

SchemaPtr SchemaComposer::ResolveAllOf(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path) const {
	const auto* list = node.find("allOf");
	if (!list->is_array() || list->as_array().empty()) {
		throw UnsupportedSchemaShapeError("allOf must list at least one schema");
	}

	std::vector<SchemaPtr> branches;
	branches.reserve(list->as_array().size() + 1);
	const auto guard = ctx.visited.push(CompositionKey(node), fmt::format("#{}", path), level, false);

	// Keywords next to allOf form the first branch.
	RawNode::Object siblings;
	for (const auto& [key, value] : node.as_object()) {
		if (key != "allOf") {
			siblings.emplace_back(key, value);
		}
	}
	if (!siblings.empty()) {
		const RawNode base(std::move(siblings));
		branches.push_back(Resolve(ctx, doc, base, level, path, false));
	}

	const auto& items = list->as_array();
	for (std::size_t i = 0; i < items.size(); ++i) {
		const auto child = Child(path, "allOf", i);
		auto branch = ExpandBackEdge(ctx, doc, items[i], level, child);
		branches.push_back(branch ? std::move(branch) : Resolve(ctx, doc, items[i], level, child));
	}
	return MergeAllOf(branches);
}

SchemaPtr SchemaComposer::ResolveUnion(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::string_view keyword,
	std::size_t level,
	const std::string& path) const {
	const auto* list = node.find(keyword);
	if (!list->is_array() || list->as_array().empty()) {
		throw UnsupportedSchemaShapeError(fmt::format("{} must list at least one schema", keyword));
	}

	auto schema = std::make_shared<ResolvedSchema>();
	ReadAnnotations(node, *schema);

	std::vector<SchemaPtr> variants;
	const auto& items = list->as_array();
	for (std::size_t i = 0; i < items.size(); ++i) {
		auto variant = ResolveNested(ctx, doc, items[i], level, Child(path, keyword, i));
		const auto* prim = variant->primitive();
		if (prim != nullptr && prim->type == "null" && items.size() > 1) {
			// oneOf: [X, {type: null}] is a nullable X.
			schema->nullable = true;
			continue;
		}
		variants.push_back(std::move(variant));
	}

	if (keyword == "oneOf") {
		schema->composition = Composition::one_of;
		auto discriminator = ReadDiscriminator(node, *doc, variants, keyword);
		schema->shape = UnionShape{std::move(variants), std::move(discriminator)};
	} else {
		schema->composition = Composition::any_of;
		schema->shape = FlexibleUnionShape{std::move(variants)};
	}
	return schema;
}

SchemaPtr SchemaComposer::ResolvePlain(ResolutionContext& ctx,
	const DocumentPtr& doc,
	const RawNode& node,
	std::size_t level,
	const std::string& path) const {
	auto schema = std::make_shared<ResolvedSchema>();
	ReadAnnotations(node, *schema);

	const auto types = ReadTypes(node);
	const std::string format(node.string_or("format"));

	if (types.names.size() > 1) {
		// type: [string, integer] reads as anyOf over the listed types.
		FlexibleUnionShape shape;
		for (const auto& name : types.names) {
			RawNode::Object single{{"type", RawNode(name)}};
			for (const std::string_view key : {"format", "properties", "required", "additionalProperties", "items"}) {
				if (const auto* value = node.find(key)) {
					single.emplace_back(std::string(key), *value);
				}
			}
			shape.variants.push_back(ResolvePlain(ctx, doc, RawNode(std::move(single)), level, path));
		}
		schema->shape = std::move(shape);
		return schema;
	}

	const std::string type = types.names.empty() ? std::string() : types.names.front();
	const auto* properties = node.find("properties");
	const auto* additional = node.find("additionalProperties");
	const auto* items = node.find("items");
	const bool has_schema_additional = additional != nullptr && additional->is_object();

	const bool object_like = type == "object" ||
		(type.empty() &&
			(properties != nullptr || has_schema_additional || node.contains("required") ||
				node.contains("discriminator")));
	const bool array_like = type == "array" || (type.empty() && items != nullptr);

	if (object_like) {
		ObjectShape shape;
		if (const auto* required = node.find("required"); required != nullptr && required->is_array()) {
			for (const auto& name : required->as_array()) {
				if (name.is_string() &&
					std::find(shape.required.begin(), shape.required.end(), name.as_string()) == shape.required.end()) {
					shape.required.push_back(name.as_string());
				}
			}
		}
		if (properties != nullptr && properties->is_object()) {
			for (const auto& [name, sub] : properties->as_object()) {
				const bool required =
					std::find(shape.required.begin(), shape.required.end(), name) != shape.required.end();
				shape.properties.push_back(
					Property{name, ResolveNested(ctx, doc, sub, level + 1, Child(path, "properties", name)), required});
			}
		}
		if (has_schema_additional) {
			shape.additional_properties =
				ResolveNested(ctx, doc, *additional, level + 1, Child(path, "additionalProperties"));
		}
		shape.discriminator = ReadDiscriminator(node, *doc, {}, "discriminator");
		schema->shape = std::move(shape);
	} else if (array_like) {
		ArrayShape shape;
		if (items != nullptr) {
			shape.items = ResolveNested(ctx, doc, *items, level + 1, Child(path, "items"));
		}
		schema->shape = std::move(shape);
	} else {
		schema->shape = PrimitiveShape{type, format};
		return schema;
	}

	if (!format.empty()) {
		schema->validation_constraints.emplace_back("format", RawNode(format));
	}
	return schema;
}

} // namespace sextant
