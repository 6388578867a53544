#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace network_log {

struct LogSettings {
    std::string file_path;  // empty: keep logging to stderr only
    spdlog::level::level_enum level = spdlog::level::info;
};

// Engine-wide logger. Falls back to spdlog's default logger until configured.
std::shared_ptr<spdlog::logger> engine_logger();

void configure_logging(const LogSettings& settings);

spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace network_log
