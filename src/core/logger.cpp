#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clockwork::core {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [clockwork] %v";
}

void init_logger() {
    init_logger(LoggingConfig{});
}

void init_logger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file,
                config.max_file_size_mb * 1024 * 1024,
                config.backup_count));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep console logging when the file cannot be opened
            spdlog::warn("Cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("clockwork", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);

    set_log_level(config.debug ? spdlog::level::debug : level_from_string(config.level));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum level_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return spdlog::level::trace;
    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARNING" || upper == "WARN") return spdlog::level::warn;
    if (upper == "ERROR") return spdlog::level::err;
    if (upper == "CRITICAL") return spdlog::level::critical;
    if (upper == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace clockwork::core
