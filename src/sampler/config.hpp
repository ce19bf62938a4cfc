#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/logger.hpp"

namespace clockwork::sampler {

// Sampler daemon configuration:
// {
//   "sampler": {"data_dir", "sample_interval", "flush_interval", "retention_hours",
//               "buffer_capacity", "enable_network_monitoring",
//               "track_processes", "track_pids",
//               "cpu_alert_threshold", "memory_alert_threshold"},
//   "logging": {"level", "file", "max_file_size", "backup_count"}
// }
struct SamplerConfig {
    std::string data_dir = "/var/lib/clockwork";
    double sample_interval_secs = 1.0;
    double flush_interval_secs = 60.0;
    double retention_hours = 168.0;         // one week
    size_t buffer_capacity = 3600;
    bool enable_network_monitoring = true;
    std::vector<std::string> track_process_patterns;
    std::vector<pid_t> track_pids;
    double cpu_alert_threshold = 90.0;      // percent
    double memory_alert_threshold = 85.0;   // percent

    core::LoggingConfig logging;

    static SamplerConfig from_json(const nlohmann::json& j);

    // CLOCKWORK_SAMPLER_DIR, CLOCKWORK_LOG_LEVEL
    void apply_env_overrides();
};

} // namespace clockwork::sampler
