#include <network_log/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace network_log {

namespace {

const char* const logger_name = "traffic_scenario";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

std::shared_ptr<spdlog::logger> engine_logger() {
    auto logger = spdlog::get(logger_name);
    if (logger) return logger;
    return spdlog::default_logger();
}

void configure_logging(const LogSettings& settings) {
    spdlog::set_level(settings.level);
    spdlog::set_pattern(log_pattern);
    if (settings.file_path.empty()) return;

    try {
        const std::filesystem::path log_file(settings.file_path);
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        spdlog::drop(logger_name);
        auto logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        logger->set_level(settings.level);
        logger->flush_on(spdlog::level::warn);
        logger->set_pattern(log_pattern);
        logger->info("Engine logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("File logging unavailable, using stderr: {}", e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("File logging unavailable, using stderr: {}", e.what());
    }
}

spdlog::level::level_enum level_from_string(const std::string& name) {
    return spdlog::level::from_str(name);
}

} // namespace network_log
