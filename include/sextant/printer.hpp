// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "resolved_schema.hpp"
#include "schema_catalog.hpp"

namespace sextant {

// Indenting line writer. Owns the stream when opened on a path, borrows it otherwise.
class Printer {
public:
	explicit Printer(const std::filesystem::path& path);
	explicit Printer(std::ostream& os);
	Printer(const Printer&) = delete;
	Printer(Printer&& other) noexcept;

	Printer& indent();
	Printer& outdent();
	Printer& endl();

	template <typename... Args>
	Printer& write(Args&&... args) {
		(*_os) << _indents;
		((*_os) << ... << args);
		(*_os) << '\n';
		return *this;
	}

	template <typename... Args>
	Printer& write_fmt(fmt::format_string<Args...> form, Args&&... args) {
		(*_os) << _indents << fmt::format(form, std::forward<Args>(args)...) << '\n';
		return *this;
	}

private:
	std::unique_ptr<std::ostream> _owned;
	std::ostream* _os;
	std::string _indents;
};

// Writes the tree of one schema, one node per line.
void PrintSchema(Printer& p, const ResolvedSchema& schema);

// Writes every schema, tag and operation of the catalog.
void PrintCatalog(Printer& p, const SchemaCatalog& catalog);

} // namespace sextant
