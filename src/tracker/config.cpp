#include "tracker/config.hpp"
#include "core/config.hpp"
#include "core/json_util.hpp"
#include <spdlog/spdlog.h>

namespace clockwork::tracker {

const char* storage_backend_to_string(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::REMOTE: return "remote";
        default: return "local";
    }
}

StorageBackend storage_backend_from_string(const std::string& str) {
    if (str == "remote" || str == "aws" || str == "dynamodb") return StorageBackend::REMOTE;
    return StorageBackend::LOCAL;
}

const char* local_format_to_string(LocalFormat format) {
    switch (format) {
        case LocalFormat::CSV: return "csv";
        default: return "json";
    }
}

LocalFormat local_format_from_string(const std::string& str) {
    if (str == "csv") return LocalFormat::CSV;
    if (str != "json") {
        spdlog::warn("Unsupported local format '{}', using json", str);
    }
    return LocalFormat::JSON;
}

const char* upload_strategy_to_string(UploadStrategy strategy) {
    switch (strategy) {
        case UploadStrategy::REAL_TIME: return "real_time";
        case UploadStrategy::BATCH: return "batch";
        case UploadStrategy::MANUAL: return "manual";
        default: return "on_exit";
    }
}

UploadStrategy upload_strategy_from_string(const std::string& str) {
    if (str == "real_time") return UploadStrategy::REAL_TIME;
    if (str == "batch") return UploadStrategy::BATCH;
    if (str == "manual") return UploadStrategy::MANUAL;
    if (str != "on_exit") {
        spdlog::warn("Unknown upload strategy '{}', using on_exit", str);
    }
    return UploadStrategy::ON_EXIT;
}

TrackerConfig TrackerConfig::from_json(const nlohmann::json& j) {
    using core::read_field;
    using core::section_of;

    TrackerConfig config;

    const auto& core_section = section_of(j, "clockwork");
    read_field(core_section, "enabled", config.enabled);
    read_field(core_section, "debug", config.logging.debug);
    read_field(core_section, "min_execution_time", config.min_execution_time);
    read_field(core_section, "max_tracked_calls", config.max_tracked_calls);
    if (config.min_execution_time < 0.0) {
        spdlog::warn("min_execution_time {} is negative, using 0", config.min_execution_time);
        config.min_execution_time = 0.0;
    }

    const auto& local = section_of(j, "local");
    bool local_enabled = false;
    if (read_field(local, "enabled", local_enabled)) {
        config.backend = local_enabled ? StorageBackend::LOCAL : StorageBackend::REMOTE;
    }
    std::string backend;
    if (read_field(section_of(j, "storage"), "backend", backend)) {
        config.backend = storage_backend_from_string(backend);
    }
    read_field(local, "data_dir", config.local.data_dir);
    std::string format;
    if (read_field(local, "format", format)) {
        config.local.format = local_format_from_string(format);
    }
    read_field(local, "max_records", config.local.max_records);

    const auto& aws = section_of(j, "aws");
    read_field(aws, "table_name", config.remote.table_name);
    read_field(aws, "region", config.remote.region);
    read_field(aws, "profile", config.remote.profile);
    read_field(aws, "read_capacity", config.remote.read_capacity);
    read_field(aws, "write_capacity", config.remote.write_capacity);
    read_field(aws, "auto_create_table", config.remote.auto_create_table);
    read_field(aws, "cli_path", config.remote.cli_path);

    const auto& upload = section_of(j, "upload");
    std::string strategy;
    if (read_field(upload, "strategy", strategy)) {
        config.upload.strategy = upload_strategy_from_string(strategy);
    }
    read_field(upload, "batch_size", config.upload.batch_size);
    read_field(upload, "batch_interval", config.upload.batch_interval_secs);
    read_field(upload, "retry_attempts", config.upload.retry_attempts);
    read_field(upload, "timeout", config.upload.timeout_secs);
    read_field(upload, "backoff_initial_ms", config.upload.backoff_initial_ms);
    read_field(upload, "backoff_max_ms", config.upload.backoff_max_ms);
    read_field(upload, "backoff_multiplier", config.upload.backoff_multiplier);
    if (config.upload.batch_size == 0) config.upload.batch_size = 1;
    if (config.upload.retry_attempts == 0) config.upload.retry_attempts = 1;

    const auto& filters = section_of(j, "filters");
    read_field(filters, "exclude_modules", config.filters.exclude_modules);
    read_field(filters, "include_modules", config.filters.include_modules);
    read_field(filters, "exclude_functions", config.filters.exclude_functions);
    read_field(filters, "include_functions", config.filters.include_functions);
    read_field(filters, "track_arguments", config.filters.track_arguments);
    read_field(filters, "track_return_values", config.filters.track_return_values);
    read_field(filters, "max_argument_length", config.filters.max_argument_length);

    const auto& logging = section_of(j, "logging");
    read_field(logging, "level", config.logging.level);
    read_field(logging, "file", config.logging.file);
    read_field(logging, "max_file_size", config.logging.max_file_size_mb);
    read_field(logging, "backup_count", config.logging.backup_count);

    bool compression = false;
    if (read_field(section_of(j, "performance"), "compression", compression) && compression) {
        spdlog::debug("Compression is not supported, flush files are written uncompressed");
    }

    const auto& correlation = section_of(j, "correlation");
    read_field(correlation, "sampler_data_dir", config.correlation.sampler_data_dir);
    read_field(correlation, "max_sample_age", config.correlation.max_sample_age_secs);
    read_field(correlation, "lookback", config.correlation.lookback_secs);

    return config;
}

void TrackerConfig::apply_env_overrides() {
    namespace env = core::config;

    if (auto value = env::get_env_bool("CLOCKWORK_ENABLED")) {
        enabled = *value;
    }
    if (auto value = env::get_env_double("CLOCKWORK_MIN_EXECUTION_TIME")) {
        if (*value >= 0.0) min_execution_time = *value;
    }
    local.data_dir = env::get_env_or("CLOCKWORK_DATA_DIR", local.data_dir);
    auto strategy = env::get_env("CLOCKWORK_UPLOAD_STRATEGY");
    if (!strategy.empty()) {
        upload.strategy = upload_strategy_from_string(strategy);
    }
    logging.level = env::get_env_or("CLOCKWORK_LOG_LEVEL", logging.level);
    correlation.sampler_data_dir = env::get_env_or("CLOCKWORK_SAMPLER_DIR", correlation.sampler_data_dir);
}

} // namespace clockwork::tracker
