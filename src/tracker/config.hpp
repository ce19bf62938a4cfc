#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logger.hpp"

namespace clockwork::tracker {

enum class StorageBackend {
    LOCAL,      // files under a directory (default)
    REMOTE      // keyed remote table
};

enum class LocalFormat {
    JSON,
    CSV
};

enum class UploadStrategy {
    ON_EXIT,    // one flush at session release (default)
    REAL_TIME,  // flush after every record
    BATCH,      // flush on batch_size or batch_interval
    MANUAL      // only on explicit flush()
};

const char* storage_backend_to_string(StorageBackend backend);
StorageBackend storage_backend_from_string(const std::string& str);
const char* local_format_to_string(LocalFormat format);
LocalFormat local_format_from_string(const std::string& str);
const char* upload_strategy_to_string(UploadStrategy strategy);
UploadStrategy upload_strategy_from_string(const std::string& str);

struct LocalStorageConfig {
    std::string data_dir = "./perf_data";
    LocalFormat format = LocalFormat::JSON;
    size_t max_records = 1000;              // across all flush files
};

struct RemoteStorageConfig {
    std::string table_name = "clockwork-perf-data";
    std::string region = "us-east-1";
    std::string profile;                    // empty = default credentials
    uint32_t read_capacity = 5;
    uint32_t write_capacity = 5;
    bool auto_create_table = true;
    std::string cli_path = "aws";
};

struct UploadConfig {
    UploadStrategy strategy = UploadStrategy::ON_EXIT;
    size_t batch_size = 100;
    double batch_interval_secs = 60.0;
    uint32_t retry_attempts = 3;            // total delivery attempts
    double timeout_secs = 30.0;
    uint32_t backoff_initial_ms = 200;
    uint32_t backoff_max_ms = 5000;
    double backoff_multiplier = 2.0;
};

struct FilterConfig {
    std::vector<std::string> exclude_modules;
    std::vector<std::string> include_modules;     // empty = all
    std::vector<std::string> exclude_functions = {"^_.*", "^test_.*"};
    std::vector<std::string> include_functions;   // empty = all
    bool track_arguments = false;
    bool track_return_values = false;
    size_t max_argument_length = 1024;            // arguments and return values
};

struct CorrelationConfig {
    std::string sampler_data_dir = "/var/lib/clockwork";
    double max_sample_age_secs = 60.0;      // older samples are not attached
    double lookback_secs = 60.0;            // read files this far before the window
};

// Configuration consumed by a Session. Sections mirror the
// configuration tree:
// {
//   "clockwork":   {"enabled", "debug", "min_execution_time", "max_tracked_calls"},
//   "storage":     {"backend": "local" | "remote"},
//   "local":       {"enabled", "data_dir", "format", "max_records"},
//   "aws":         {"table_name", "region", "profile", "read_capacity",
//                   "write_capacity", "auto_create_table", "cli_path"},
//   "upload":      {"strategy", "batch_size", "batch_interval", "retry_attempts",
//                   "timeout", "backoff_initial_ms", "backoff_max_ms", "backoff_multiplier"},
//   "filters":     {"exclude_modules", "include_modules", "exclude_functions",
//                   "include_functions", "track_arguments", "track_return_values",
//                   "max_argument_length"},
//   "logging":     {"level", "file", "max_file_size", "backup_count"},
//   "correlation": {"sampler_data_dir", "max_sample_age", "lookback"}
// }
struct TrackerConfig {
    bool enabled = true;
    double min_execution_time = 0.001;      // seconds
    size_t max_tracked_calls = 10000;       // per session
    StorageBackend backend = StorageBackend::LOCAL;

    LocalStorageConfig local;
    RemoteStorageConfig remote;
    UploadConfig upload;
    FilterConfig filters;
    core::LoggingConfig logging;
    CorrelationConfig correlation;

    static TrackerConfig from_json(const nlohmann::json& j);

    // CLOCKWORK_ENABLED, CLOCKWORK_MIN_EXECUTION_TIME, CLOCKWORK_DATA_DIR,
    // CLOCKWORK_UPLOAD_STRATEGY, CLOCKWORK_LOG_LEVEL, CLOCKWORK_SAMPLER_DIR
    void apply_env_overrides();
};

} // namespace clockwork::tracker
