#pragma once
#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>

namespace clockwork::core {

struct LoggingConfig {
    std::string level = "INFO";        // DEBUG, INFO, WARNING, ERROR, CRITICAL
    std::string file;                  // empty = console only
    size_t max_file_size_mb = 10;
    size_t backup_count = 5;
    bool debug = false;                // forces DEBUG
};

// Initialize logging with console output (stderr)
void init_logger();

// Initialize logging with console output and an optional rotating file
void init_logger(const LoggingConfig& config);

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Map a level name ("DEBUG", "warning", ...) to spdlog; unknown names give info
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace clockwork::core
