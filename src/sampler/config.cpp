#include "sampler/config.hpp"
#include "core/config.hpp"
#include "core/json_util.hpp"
#include <spdlog/spdlog.h>

namespace clockwork::sampler {

SamplerConfig SamplerConfig::from_json(const nlohmann::json& j) {
    using core::read_field;
    using core::section_of;

    SamplerConfig config;
    SamplerConfig defaults;

    const auto& sampler = section_of(j, "sampler");
    read_field(sampler, "data_dir", config.data_dir);
    read_field(sampler, "sample_interval", config.sample_interval_secs);
    read_field(sampler, "flush_interval", config.flush_interval_secs);
    read_field(sampler, "retention_hours", config.retention_hours);
    read_field(sampler, "buffer_capacity", config.buffer_capacity);
    read_field(sampler, "enable_network_monitoring", config.enable_network_monitoring);
    read_field(sampler, "track_processes", config.track_process_patterns);
    read_field(sampler, "track_pids", config.track_pids);
    read_field(sampler, "cpu_alert_threshold", config.cpu_alert_threshold);
    read_field(sampler, "memory_alert_threshold", config.memory_alert_threshold);

    if (config.sample_interval_secs <= 0.0) {
        spdlog::warn("sample_interval {} must be positive, using {}",
                     config.sample_interval_secs, defaults.sample_interval_secs);
        config.sample_interval_secs = defaults.sample_interval_secs;
    }
    if (config.flush_interval_secs < config.sample_interval_secs) {
        spdlog::warn("flush_interval {} shorter than sample_interval, using {}",
                     config.flush_interval_secs, config.sample_interval_secs);
        config.flush_interval_secs = config.sample_interval_secs;
    }
    if (config.retention_hours <= 0.0) {
        spdlog::warn("retention_hours {} must be positive, using {}",
                     config.retention_hours, defaults.retention_hours);
        config.retention_hours = defaults.retention_hours;
    }
    if (config.buffer_capacity == 0) {
        config.buffer_capacity = 1;
    }

    const auto& logging = section_of(j, "logging");
    read_field(logging, "level", config.logging.level);
    read_field(logging, "file", config.logging.file);
    read_field(logging, "max_file_size", config.logging.max_file_size_mb);
    read_field(logging, "backup_count", config.logging.backup_count);

    return config;
}

void SamplerConfig::apply_env_overrides() {
    namespace env = core::config;
    data_dir = env::get_env_or("CLOCKWORK_SAMPLER_DIR", data_dir);
    logging.level = env::get_env_or("CLOCKWORK_LOG_LEVEL", logging.level);
}

} // namespace clockwork::sampler
