// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace sextant {

enum class RequestMethod {
	POST,
	PUT,
	GET,
	DELETE,
	PATCH, // common ones
	HEAD,
	OPTIONS,
	TRACE, // uncommon ones
	UNKNOWN
};

// Case-insensitive; keys of a path item that are not methods give UNKNOWN.
RequestMethod RequestMethodFromString(std::string_view key);
std::string_view RequestMethodToString(RequestMethod rm);

// Synthesize a function name give a path and its verb.
// Use this to get an identifier when the globally unique operationId is unavailable.
std::string SynthesizeFunctionName(std::string_view pathstr, RequestMethod verb);

} // namespace sextant
