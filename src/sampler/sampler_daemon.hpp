#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "metrics/metrics.hpp"
#include "sampler/config.hpp"
#include "sampler/instance_lock.hpp"
#include "sampler/metric_file_store.hpp"
#include "sampler/sample_buffer.hpp"
#include "sampler/sample_source.hpp"

namespace clockwork::sampler {

// ============================================================================
// Daemon State
// ============================================================================

enum class DaemonState {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING,
    CRASHED
};

const char* daemon_state_to_string(DaemonState state);
DaemonState daemon_state_from_string(const std::string& str);

struct DaemonStatus {
    DaemonState state = DaemonState::STOPPED;
    pid_t pid = 0;
    std::string data_dir;
    int64_t started_at_ms = 0;
    int64_t last_sample_ms = 0;         // 0 = none yet
    int64_t last_flush_ms = 0;
    size_t samples_buffered = 0;
    size_t samples_dropped = 0;         // evicted from a full buffer
    size_t metric_file_count = 0;

    nlohmann::json to_json() const;
    static DaemonStatus from_json(const nlohmann::json& j);
};

// ============================================================================
// Sampler Daemon
// ============================================================================

/**
 * Background system sampler.
 *
 * STOPPED -> STARTING -> RUNNING -> STOPPING -> STOPPED, or CRASHED when the
 * loop cannot continue. One instance per data directory, enforced by an
 * exclusive flock on <data_dir>/sampler.lock. The loop runs on the calling
 * thread; request_stop() may be called from any thread or a signal handler.
 */
class SamplerDaemon {
public:
    explicit SamplerDaemon(SamplerConfig config,
                           std::unique_ptr<SampleSource> source = nullptr);
    ~SamplerDaemon();

    SamplerDaemon(const SamplerDaemon&) = delete;
    SamplerDaemon& operator=(const SamplerDaemon&) = delete;

    // Acquire the instance lock and enter RUNNING. False on startup failure.
    bool start();

    // Sample/flush loop until request_stop(); drains the buffer on exit.
    // Returns false if the loop crashed.
    bool run();

    // Async-signal-safe
    void request_stop() noexcept;

    // CRASHED -> STOPPED
    bool reset();

    // Single steps of the loop, usable while RUNNING
    bool sample_once();
    bool flush();

    DaemonState state() const { return state_.load(); }
    DaemonStatus status() const;
    size_t alert_count() const { return alert_count_.load(); }

    const SamplerConfig& config() const { return config_; }
    MetricFileStore& files() { return files_; }

private:
    SamplerConfig config_;
    std::filesystem::path data_dir_;
    std::unique_ptr<SampleSource> source_;
    SampleBuffer<metrics::SystemSample> buffer_;
    MetricFileStore files_;
    InstanceLock lock_;

    std::atomic<DaemonState> state_{DaemonState::STOPPED};
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> alert_count_{0};
    int wake_fd_ = -1;                  // eventfd poked by request_stop()

    mutable std::mutex status_mutex_;
    int64_t started_at_ms_ = 0;
    int64_t last_sample_ms_ = 0;
    int64_t last_flush_ms_ = 0;
    bool cpu_alert_active_ = false;
    bool memory_alert_active_ = false;

    void set_state(DaemonState state);
    void write_status();
    void check_thresholds(const metrics::SystemSample& sample);
    void drain_and_stop();
};

// Status file of the daemon owning data_dir. A RUNNING/STARTING/STOPPING
// status whose lock is no longer held is reported as CRASHED.
std::optional<DaemonStatus> read_daemon_status(const std::filesystem::path& data_dir);

// Send SIGTERM to the daemon holding data_dir's lock. False if none runs.
bool signal_daemon_stop(const std::filesystem::path& data_dir);

} // namespace clockwork::sampler
