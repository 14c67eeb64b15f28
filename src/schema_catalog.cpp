// SPDX-License-Identifier: Apache-2.0
#include <sextant/error.hpp>
#include <sextant/json_pointer.hpp>
#include <sextant/log.hpp>
#include <sextant/reference_resolver.hpp>
#include <sextant/schema_catalog.hpp>
#include <sextant/schema_composer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <latch>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>

namespace sextant {

namespace {

// Counts concurrent top-level resolutions and remembers the peak.
class InFlightGuard {
public:
	InFlightGuard(std::atomic<std::size_t>& current, std::atomic<std::size_t>& peak) noexcept
		: _current(current) {
		const auto now = ++_current;
		auto seen = peak.load();
		while (now > seen && !peak.compare_exchange_weak(seen, now)) {
		}
	}
	InFlightGuard(const InFlightGuard&) = delete;
	InFlightGuard& operator=(const InFlightGuard&) = delete;
	~InFlightGuard() { --_current; }

private:
	std::atomic<std::size_t>& _current;
};

std::string Describe(const std::exception_ptr& error) {
	try {
		std::rethrow_exception(error);
	} catch (const Error& e) {
		return e.formatted();
	} catch (const std::exception& e) {
		return e.what();
	}
}

// Follows a $ref to a non-schema component (parameter, request body, response).
const RawNode& Deref(const Document& doc, const RawNode& node) {
	const auto* ref = node.find("$ref");
	if (ref == nullptr || !ref->is_string()) {
		return node;
	}
	const SchemaReference target{ref->as_string()};
	if (!target.is_local()) {
		throw Error(ErrorCode::invalid_reference_format,
			fmt::format("Only local references are supported outside schemas: {}", target.pointer));
	}
	return resolve_pointer(doc.root, target.fragment(), target.pointer);
}

std::vector<MediaSchema> ReadContent(
	const SchemaComposer& composer, const DocumentPtr& doc, const RawNode& node, const std::string& path) {
	std::vector<MediaSchema> out;
	const auto* content = node.find("content");
	if (content == nullptr || !content->is_object()) {
		return out;
	}
	for (const auto& [media_type, media] : content->as_object()) {
		MediaSchema entry{media_type, nullptr};
		if (const auto* schema = media.find("schema")) {
			entry.schema = composer.resolve_schema(
				doc, *schema, fmt::format("{}/content/{}/schema", path, encode_pointer_token(media_type)));
		}
		out.push_back(std::move(entry));
	}
	return out;
}

void ReadParameters(const SchemaComposer& composer,
	const DocumentPtr& doc,
	const RawNode* list,
	const std::string& path,
	std::vector<ParameterInfo>& out) {
	if (list == nullptr || !list->is_array()) {
		return;
	}
	const auto& items = list->as_array();
	for (std::size_t i = 0; i < items.size(); ++i) {
		const auto& param = Deref(*doc, items[i]);
		ParameterInfo info;
		info.name = param.string_or("name");
		info.location = param.string_or("in");
		info.required = param.bool_or("required", info.location == "path");
		const auto param_path = fmt::format("{}/parameters/{}", path, i);
		if (const auto* schema = param.find("schema")) {
			info.schema = composer.resolve_schema(doc, *schema, param_path + "/schema");
		} else if (auto content = ReadContent(composer, doc, param, param_path); !content.empty()) {
			info.schema = content.front().schema;
		}
		// Operation level parameters override path level ones with the same name and location.
		const auto it = std::find_if(out.begin(), out.end(), [&](const ParameterInfo& p) {
			return p.name == info.name && p.location == info.location;
		});
		if (it != out.end()) {
			*it = std::move(info);
		} else {
			out.push_back(std::move(info));
		}
	}
}

OperationInfo ReadOperation(const SchemaComposer& composer,
	const DocumentPtr& doc,
	RequestMethod method,
	const std::string& path,
	const RawNode& item,
	const RawNode& op) {
	const auto op_path =
		fmt::format("/paths/{}/{}", encode_pointer_token(path), RequestMethodToString(method));

	OperationInfo info;
	info.method = method;
	info.path = path;
	info.operation_id = op.string_or("operationId");
	if (info.operation_id.empty()) {
		info.operation_id = SynthesizeFunctionName(path, method);
	}
	info.summary = op.string_or("summary");
	info.deprecated = op.bool_or("deprecated");
	if (const auto* tags = op.find("tags"); tags != nullptr && tags->is_array()) {
		for (const auto& tag : tags->as_array()) {
			if (tag.is_string()) {
				info.tags.push_back(tag.as_string());
			}
		}
	}

	ReadParameters(composer, doc, item.find("parameters"), fmt::format("/paths/{}", encode_pointer_token(path)), info.parameters);
	ReadParameters(composer, doc, op.find("parameters"), op_path, info.parameters);

	if (const auto* body = op.find("requestBody")) {
		const auto& resolved = Deref(*doc, *body);
		RequestBodyInfo request;
		request.required = resolved.bool_or("required");
		request.content = ReadContent(composer, doc, resolved, op_path + "/requestBody");
		info.request_body = std::move(request);
	}

	if (const auto* responses = op.find("responses"); responses != nullptr && responses->is_object()) {
		for (const auto& [status, response] : responses->as_object()) {
			const auto& resolved = Deref(*doc, response);
			ResponseInfo entry;
			entry.status = status;
			entry.description = resolved.string_or("description");
			entry.content = ReadContent(
				composer, doc, resolved, fmt::format("{}/responses/{}", op_path, encode_pointer_token(status)));
			info.responses.push_back(std::move(entry));
		}
	}
	return info;
}

std::vector<std::string> DocumentTags(const RawNode& root) {
	std::vector<std::string> tags;
	if (const auto* list = root.find("tags"); list != nullptr && list->is_array()) {
		for (const auto& tag : list->as_array()) {
			const auto name = tag.string_or("name");
			if (!name.empty()) {
				tags.emplace_back(name);
			}
		}
	}
	return tags;
}

void SortUnique(std::vector<std::string>& values) {
	std::sort(values.begin(), values.end());
	values.erase(std::unique(values.begin(), values.end()), values.end());
}

} // namespace

SchemaPtr SchemaCatalog::find(std::string_view name) const noexcept {
	const auto it = std::find_if(schemas.begin(), schemas.end(), [&](const auto& entry) { return entry.first == name; });
	return it == schemas.end() ? nullptr : it->second;
}

CatalogBuilder::CatalogBuilder()
	: CatalogBuilder(Config{}) {}

CatalogBuilder::CatalogBuilder(Config config, std::shared_ptr<ExternalResolver> external, MemoryController::Sampler sampler)
	: _config(config)
	, _external(std::move(external))
	, _cache(config.cache_options())
	, _memory(config.memory_options(), std::move(sampler)) {
	_config.validate();
}

std::optional<CatalogMetrics> CatalogBuilder::metrics() const {
	if (!_config.metrics_enabled) {
		return std::nullopt;
	}
	return _metrics;
}

CatalogPtr CatalogBuilder::build(const DocumentPtr& doc, std::stop_token stop) {
	const auto started = std::chrono::steady_clock::now();
	_cache.clear();
	_metrics = CatalogMetrics{};

	const ReferenceResolver resolver(_external, _config.external_timeout);
	CacheMemo memo(_cache);
	const SchemaComposer composer(resolver, _config.caching_enabled ? &memo : nullptr, _config.composer_options());

	std::vector<std::string> names;
	if (const auto* components = doc->root.find("components")) {
		if (const auto* schemas = components->find("schemas"); schemas != nullptr && schemas->is_object()) {
			for (const auto& member : schemas->as_object()) {
				names.push_back(member.first);
			}
		}
	}

	// Results land in declaration slots, whichever worker finishes first.
	const auto total = names.size();
	std::vector<SchemaPtr> resolved(total);
	std::vector<std::exception_ptr> errors(total);
	std::atomic<std::size_t> in_flight{0};
	std::atomic<std::size_t> peak{0};

	auto snapshot = [&](bool with_operations) {
		auto catalog = std::make_shared<SchemaCatalog>();
		for (std::size_t i = 0; i < total; ++i) {
			if (resolved[i]) {
				catalog->schemas.emplace_back(names[i], resolved[i]);
			}
		}
		catalog->tags = DocumentTags(doc->root);
		if (!with_operations) {
			SortUnique(catalog->tags);
		}
		return catalog;
	};

	auto finish_metrics = [&] {
		_metrics.cache = _cache.stats();
		_metrics.memory = _memory.stats();
		_metrics.peak_in_flight = peak.load();
		_metrics.elapsed =
			std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
	};

	const auto batch = _memory.batch_size() == 0 ? std::max<std::size_t>(total, 1) : _memory.batch_size();
	{
		boost::asio::thread_pool pool(_config.worker_threads);
		for (std::size_t begin = 0; begin < total; begin += batch) {
			if (stop.stop_requested()) {
				pool.join();
				finish_metrics();
				log(LogLevel::info, "Cancelled after {} of {} schemas", begin, total);
				throw CancelledError(snapshot(false));
			}

			const auto end = std::min(total, begin + batch);
			std::latch done(static_cast<std::ptrdiff_t>(end - begin));
			for (std::size_t i = begin; i < end; ++i) {
				boost::asio::post(pool, [&, i] {
					{
						InFlightGuard guard(in_flight, peak);
						try {
							resolved[i] = composer.resolve_named(doc, names[i]);
						} catch (...) {
							errors[i] = std::current_exception();
						}
					}
					done.count_down();
				});
			}
			done.wait();

			++_metrics.batches;
			log(LogLevel::debug, "Batch {} done: {}/{} schemas", _metrics.batches, end, total);
			_memory.after_batch(_cache);
			if (_observer) {
				_observer(end, total);
			}
		}
		pool.join();
	}

	std::vector<SchemaFailure> failures;
	for (std::size_t i = 0; i < total; ++i) {
		if (errors[i]) {
			failures.push_back(SchemaFailure{names[i], Describe(errors[i]), errors[i]});
		} else {
			++_metrics.schemas_resolved;
		}
	}

	if (stop.stop_requested()) {
		finish_metrics();
		throw CancelledError(snapshot(false));
	}

	auto catalog = snapshot(true);
	if (const auto* paths = doc->root.find("paths"); paths != nullptr && paths->is_object()) {
		for (const auto& [path, item] : paths->as_object()) {
			if (!item.is_object()) {
				continue;
			}
			for (const auto& [key, op] : item.as_object()) {
				const auto method = RequestMethodFromString(key);
				if (method == RequestMethod::UNKNOWN || !op.is_object()) {
					continue;
				}
				try {
					auto info = ReadOperation(composer, doc, method, path, item, op);
					catalog->tags.insert(catalog->tags.end(), info.tags.begin(), info.tags.end());
					catalog->operations.push_back(std::move(info));
					++_metrics.operations_resolved;
				} catch (const std::exception&) {
					const auto error = std::current_exception();
					failures.push_back(SchemaFailure{
						fmt::format("{} {}", RequestMethodToString(method), path), Describe(error), error});
				}
			}
		}
	}
	SortUnique(catalog->tags);
	finish_metrics();

	if (!failures.empty()) {
		for (const auto& failure : failures) {
			log(LogLevel::error, "{}: {}", failure.subject, failure.message);
		}
		throw CatalogError(std::move(failures));
	}

	log(LogLevel::info,
		"Resolved {} schemas and {} operations in {} ms",
		_metrics.schemas_resolved,
		_metrics.operations_resolved,
		_metrics.elapsed.count());
	return catalog;
}

} // namespace sextant
