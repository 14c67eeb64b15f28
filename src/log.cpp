// SPDX-License-Identifier: Apache-2.0
#include <sextant/log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace sextant {

namespace {

std::atomic<LogLevel> g_level{LogLevel::info};
std::atomic<std::ostream*> g_sink{&std::clog};
std::mutex g_sink_mutex;

std::string_view level_tag(LogLevel level) noexcept {
	switch (level) {
	case LogLevel::debug:
		return "debug";
	case LogLevel::info:
		return "info";
	case LogLevel::warning:
		return "warning";
	case LogLevel::error:
		return "error";
	default:
		break;
	}
	return "";
}

} // namespace

void set_log_level(LogLevel level) noexcept { g_level.store(level); }
LogLevel log_level() noexcept { return g_level.load(); }
void set_log_sink(std::ostream& os) noexcept { g_sink.store(&os); }

void write_log(LogLevel level, std::string_view line) {
	std::lock_guard lock(g_sink_mutex);
	auto& os = *g_sink.load();
	os << "[sextant] " << level_tag(level) << ": " << line << std::endl;
}

} // namespace sextant
