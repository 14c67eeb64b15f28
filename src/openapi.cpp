// SPDX-License-Identifier: Apache-2.0
#include <sextant/openapi.hpp>

#include "util.hpp"

namespace sextant {

RequestMethod RequestMethodFromString(std::string_view key) {
#define SEXTANT_REQUEST_METHOD_CAST(METHOD)                                                                            \
	if (compare_ignore_case(key, #METHOD))                                                                             \
		return RequestMethod::METHOD;

	SEXTANT_REQUEST_METHOD_CAST(POST)
	SEXTANT_REQUEST_METHOD_CAST(PUT)
	SEXTANT_REQUEST_METHOD_CAST(GET)
	SEXTANT_REQUEST_METHOD_CAST(DELETE)
	SEXTANT_REQUEST_METHOD_CAST(PATCH)
	SEXTANT_REQUEST_METHOD_CAST(HEAD)
	SEXTANT_REQUEST_METHOD_CAST(OPTIONS)
	SEXTANT_REQUEST_METHOD_CAST(TRACE)
#undef SEXTANT_REQUEST_METHOD_CAST

	return RequestMethod::UNKNOWN;
}

std::string_view RequestMethodToString(RequestMethod rm) {
	switch (rm) {
	case RequestMethod::DELETE:
		return "delete";
	case RequestMethod::GET:
		return "get";
	case RequestMethod::HEAD:
		return "head";
	case RequestMethod::OPTIONS:
		return "options";
	case RequestMethod::PATCH:
		return "patch";
	case RequestMethod::POST:
		return "post";
	case RequestMethod::PUT:
		return "put";
	case RequestMethod::TRACE:
		return "trace";
	default:
		break;
	}
	return "unknown";
}

std::string SynthesizeFunctionName(std::string_view pathstr, RequestMethod verb) {
	// sanitize() already turns '/', '{' and '}' into underscores.
	return std::string(RequestMethodToString(verb)) + '_' + sanitize(pathstr);
}

} // namespace sextant
