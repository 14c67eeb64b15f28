// SPDX-License-Identifier: Apache-2.0
#include <sextant/printer.hpp>

#include <fstream>
#include <stdexcept>

namespace sextant {

Printer::Printer(const std::filesystem::path& path)
	: _owned(std::make_unique<std::ofstream>(path))
	, _os(_owned.get()) {
	if (!*_os) {
		throw std::runtime_error(fmt::format("Cannot open {} for writing", path.string()));
	}
}

Printer::Printer(std::ostream& os)
	: _os(&os) {}

Printer::Printer(Printer&& other) noexcept
	: _owned(std::move(other._owned))
	, _os(other._os)
	, _indents(std::move(other._indents)) {}

Printer& Printer::indent() {
	_indents.push_back('\t');
	return *this;
}

Printer& Printer::outdent() {
	if (!_indents.empty()) {
		_indents.pop_back();
	}
	return *this;
}

Printer& Printer::endl() {
	(*_os) << std::endl;
	return *this;
}

namespace {

std::string Flags(const ResolvedSchema& schema) {
	std::string out;
	if (schema.nullable) {
		out += " nullable";
	}
	if (schema.composition != Composition::none) {
		out += fmt::format(" ({})", to_string(schema.composition));
	}
	if (schema.metadata.deprecated) {
		out += " deprecated";
	}
	if (schema.metadata.read_only) {
		out += " readOnly";
	}
	if (schema.metadata.write_only) {
		out += " writeOnly";
	}
	return out;
}

void PrintDiscriminator(Printer& p, const Discriminator& d) {
	p.write_fmt("discriminator: {}", d.property_name);
	p.indent();
	for (const auto& [value, name] : d.mapping) {
		p.write_fmt("{} -> {}", value, name);
	}
	p.outdent();
}

void PrintNode(Printer& p, const ResolvedSchema& schema) {
	for (const auto& [keyword, value] : schema.validation_constraints) {
		p.write_fmt("{}: {}", keyword, value.dump());
	}
	if (const auto* obj = schema.object()) {
		for (const auto& prop : obj->properties) {
			p.write_fmt("{}{}: {}{}", prop.name, prop.required ? "*" : "", to_string(prop.schema->kind()), Flags(*prop.schema));
			p.indent();
			PrintNode(p, *prop.schema);
			p.outdent();
		}
		if (obj->additional_properties) {
			p.write_fmt("additionalProperties: {}", describe(*obj->additional_properties));
		}
		if (obj->discriminator) {
			PrintDiscriminator(p, *obj->discriminator);
		}
	} else if (const auto* arr = schema.array()) {
		if (arr->items) {
			p.write_fmt("items: {}{}", to_string(arr->items->kind()), Flags(*arr->items));
			p.indent();
			PrintNode(p, *arr->items);
			p.outdent();
		}
	} else if (const auto* prim = schema.primitive()) {
		if (!prim->format.empty()) {
			p.write_fmt("format: {}", prim->format);
		}
	} else if (const auto* u = schema.one_of()) {
		for (const auto& variant : u->variants) {
			p.write("| ", describe(*variant));
		}
		if (u->discriminator) {
			PrintDiscriminator(p, *u->discriminator);
		}
	} else if (const auto* f = schema.any_of()) {
		for (const auto& variant : f->variants) {
			p.write("| ", describe(*variant));
		}
	} else if (const auto* r = schema.recursive()) {
		p.write_fmt("-> {}", r->pointer);
	}
}

} // namespace

void PrintSchema(Printer& p, const ResolvedSchema& schema) {
	p.write_fmt("{}{}", to_string(schema.kind()), Flags(schema));
	if (!schema.metadata.title.empty()) {
		p.write_fmt("title: {}", schema.metadata.title);
	}
	p.indent();
	PrintNode(p, schema);
	p.outdent();
}

void PrintCatalog(Printer& p, const SchemaCatalog& catalog) {
	p.write("schemas:");
	p.indent();
	for (const auto& [name, schema] : catalog.schemas) {
		p.write(name, ":");
		p.indent();
		PrintSchema(p, *schema);
		p.outdent();
	}
	p.outdent();

	p.write("tags:");
	p.indent();
	for (const auto& tag : catalog.tags) {
		p.write(tag);
	}
	p.outdent();

	p.write("operations:");
	p.indent();
	for (const auto& op : catalog.operations) {
		p.write_fmt("{} {} ({}){}", RequestMethodToString(op.method), op.path, op.operation_id, op.deprecated ? " deprecated" : "");
		p.indent();
		for (const auto& param : op.parameters) {
			p.write_fmt("{} in {}{}: {}", param.name, param.location, param.required ? "*" : "", param.schema ? describe(*param.schema) : "-");
		}
		if (op.request_body) {
			for (const auto& media : op.request_body->content) {
				p.write_fmt("body {}{}: {}", media.media_type, op.request_body->required ? "*" : "", media.schema ? describe(*media.schema) : "-");
			}
		}
		for (const auto& response : op.responses) {
			if (response.content.empty()) {
				p.write_fmt("{}: {}", response.status, response.description);
			}
			for (const auto& media : response.content) {
				p.write_fmt("{} {}: {}", response.status, media.media_type, media.schema ? describe(*media.schema) : "-");
			}
		}
		p.outdent();
	}
	p.outdent();
}

} // namespace sextant
