// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "resolved_schema.hpp"

namespace sextant {

// Reference keys expanded while computing a result, sorted and unique.
using Dependencies = std::vector<std::string>;
using DependenciesPtr = std::shared_ptr<const Dependencies>;

struct Computed {
	SchemaPtr value;
	// False when the value depends on the resolution stack it was computed under.
	bool cacheable = true;
	DependenciesPtr dependencies;
};

// Seam between the composer and whatever memoizes its results. The composer never
// knows whether a result came from a store.
class ResolutionMemo {
public:
	using Usable = std::function<bool(const Dependencies&)>;
	using Compute = std::function<Computed()>;

	virtual ~ResolutionMemo() = default;

	// Returns a stored result for `key` if `usable` accepts its dependencies, otherwise
	// runs `compute` and may store the result.
	virtual Computed memoize(const std::string& key, const Usable& usable, const Compute& compute) = 0;
};

} // namespace sextant
