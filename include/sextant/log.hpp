// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace sextant {

enum class LogLevel : uint8_t { debug, info, warning, error, off };

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// Redirects log lines, defaults to std::clog. The stream must outlive all logging.
void set_log_sink(std::ostream& os) noexcept;

void write_log(LogLevel level, std::string_view line);

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> form, Args&&... args) {
	if (level < log_level()) {
		return;
	}
	write_log(level, fmt::format(form, std::forward<Args>(args)...));
}

} // namespace sextant
