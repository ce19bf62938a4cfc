#include "sampler/sampler_daemon.hpp"
#include "core/clock.hpp"
#include "core/paths.hpp"
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstring>
#include <fstream>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace clockwork::sampler {

namespace {

constexpr const char* kLockFile = "sampler.lock";
constexpr const char* kStatusFile = "status.json";

timespec to_timespec(double seconds) {
    timespec ts;
    ts.tv_sec = static_cast<time_t>(seconds);
    ts.tv_nsec = static_cast<long>((seconds - std::floor(seconds)) * 1e9);
    if (ts.tv_sec == 0 && ts.tv_nsec == 0) {
        ts.tv_nsec = 1000000;   // timerfd treats zero as disarm
    }
    return ts;
}

int64_t now_ms() {
    return core::to_epoch_ms(std::chrono::system_clock::now());
}

} // namespace

// ============================================================================
// Daemon State
// ============================================================================

const char* daemon_state_to_string(DaemonState state) {
    switch (state) {
        case DaemonState::STOPPED: return "STOPPED";
        case DaemonState::STARTING: return "STARTING";
        case DaemonState::RUNNING: return "RUNNING";
        case DaemonState::STOPPING: return "STOPPING";
        case DaemonState::CRASHED: return "CRASHED";
        default: return "UNKNOWN";
    }
}

DaemonState daemon_state_from_string(const std::string& str) {
    if (str == "STARTING") return DaemonState::STARTING;
    if (str == "RUNNING") return DaemonState::RUNNING;
    if (str == "STOPPING") return DaemonState::STOPPING;
    if (str == "CRASHED") return DaemonState::CRASHED;
    return DaemonState::STOPPED;
}

nlohmann::json DaemonStatus::to_json() const {
    return nlohmann::json{
        {"state", daemon_state_to_string(state)},
        {"pid", pid},
        {"data_dir", data_dir},
        {"started_at_ms", started_at_ms},
        {"last_sample_ms", last_sample_ms},
        {"last_flush_ms", last_flush_ms},
        {"samples_buffered", samples_buffered},
        {"samples_dropped", samples_dropped},
        {"metric_file_count", metric_file_count}
    };
}

DaemonStatus DaemonStatus::from_json(const nlohmann::json& j) {
    DaemonStatus status;
    status.state = daemon_state_from_string(j.value("state", "STOPPED"));
    status.pid = j.value("pid", 0);
    status.data_dir = j.value("data_dir", "");
    status.started_at_ms = j.value("started_at_ms", int64_t{0});
    status.last_sample_ms = j.value("last_sample_ms", int64_t{0});
    status.last_flush_ms = j.value("last_flush_ms", int64_t{0});
    status.samples_buffered = j.value("samples_buffered", size_t{0});
    status.samples_dropped = j.value("samples_dropped", size_t{0});
    status.metric_file_count = j.value("metric_file_count", size_t{0});
    return status;
}

// ============================================================================
// Sampler Daemon
// ============================================================================

SamplerDaemon::SamplerDaemon(SamplerConfig config, std::unique_ptr<SampleSource> source)
    : config_(std::move(config))
    , data_dir_(core::paths::expand_user(config_.data_dir))
    , source_(std::move(source))
    , buffer_(config_.buffer_capacity)
    , files_(data_dir_)
    , lock_(data_dir_ / kLockFile) {
    if (!source_) {
        source_ = std::make_unique<ProcSampleSource>(config_);
    }
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::warn("eventfd failed ({}), stop requests are polled", strerror(errno));
    }
}

SamplerDaemon::~SamplerDaemon() {
    if (state_.load() == DaemonState::RUNNING) {
        drain_and_stop();
    }
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
}

void SamplerDaemon::set_state(DaemonState state) {
    state_.store(state);
    spdlog::info("Sampler {}", daemon_state_to_string(state));
}

bool SamplerDaemon::start() {
    DaemonState current = state_.load();
    if (current != DaemonState::STOPPED) {
        spdlog::warn("Cannot start sampler in state {}", daemon_state_to_string(current));
        return false;
    }

    stop_requested_.store(false);
    set_state(DaemonState::STARTING);

    if (!core::paths::ensure_directory(data_dir_) || !lock_.acquire()) {
        // Status file belongs to whoever holds the lock; leave it alone
        spdlog::error("Sampler startup failed for {}", data_dir_.string());
        set_state(DaemonState::STOPPED);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        started_at_ms_ = now_ms();
        last_sample_ms_ = 0;
        last_flush_ms_ = 0;
        cpu_alert_active_ = false;
        memory_alert_active_ = false;
    }

    size_t existing = files_.file_count();
    if (existing > 0) {
        spdlog::info("Resuming with {} existing metric files in {}", existing,
                     files_.directory().string());
    }

    set_state(DaemonState::RUNNING);
    write_status();
    return true;
}

bool SamplerDaemon::run() {
    if (state_.load() != DaemonState::RUNNING) {
        spdlog::error("Sampler run() requires RUNNING, state is {}",
                      daemon_state_to_string(state_.load()));
        return false;
    }

    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        spdlog::critical("timerfd_create failed: {}", strerror(errno));
        set_state(DaemonState::CRASHED);
        write_status();
        lock_.release();
        return false;
    }

    itimerspec its{};
    its.it_interval = to_timespec(config_.sample_interval_secs);
    its.it_value = its.it_interval;
    if (timerfd_settime(tfd, 0, &its, nullptr) != 0) {
        spdlog::critical("timerfd_settime failed: {}", strerror(errno));
        close(tfd);
        set_state(DaemonState::CRASHED);
        write_status();
        lock_.release();
        return false;
    }

    spdlog::info("Sampling every {}s, flushing every {}s into {}",
                 config_.sample_interval_secs, config_.flush_interval_secs,
                 files_.directory().string());

    const auto flush_every = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config_.flush_interval_secs));
    auto next_flush = std::chrono::steady_clock::now() + flush_every;

    sample_once();

    pollfd fds[2];
    fds[0].fd = tfd;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fd_;           // ignored by poll when negative
    fds[1].events = POLLIN;
    const int timeout_ms = wake_fd_ >= 0 ? -1 : 200;

    bool crashed = false;
    while (!stop_requested_.load()) {
        fds[0].revents = 0;
        fds[1].revents = 0;
        int n = poll(fds, 2, timeout_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::critical("poll failed: {}", strerror(errno));
            crashed = true;
            break;
        }

        if (fds[1].revents & POLLIN) {
            uint64_t value;
            while (read(wake_fd_, &value, sizeof(value)) == sizeof(value)) {}
            continue;
        }

        if (!(fds[0].revents & POLLIN)) continue;

        uint64_t expirations = 0;
        if (read(tfd, &expirations, sizeof(expirations)) != sizeof(expirations)) {
            continue;
        }
        // Missed ticks are dropped, not replayed
        if (expirations > 1) {
            spdlog::debug("Sampler behind schedule, skipped {} ticks", expirations - 1);
        }

        try {
            sample_once();
            auto now = std::chrono::steady_clock::now();
            if (now >= next_flush) {
                flush();
                while (next_flush <= now) {
                    next_flush += flush_every;
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Sampler tick failed: {}", e.what());
        }
    }

    close(tfd);

    if (crashed) {
        set_state(DaemonState::CRASHED);
        write_status();
        lock_.release();
        return false;
    }

    drain_and_stop();
    return true;
}

void SamplerDaemon::request_stop() noexcept {
    stop_requested_.store(true);
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        // On failure the loop still sees the flag at its next tick
        if (::write(wake_fd_, &one, sizeof(one)) < 0) {
            return;
        }
    }
}

bool SamplerDaemon::reset() {
    DaemonState expected = DaemonState::CRASHED;
    if (!state_.compare_exchange_strong(expected, DaemonState::STOPPED)) {
        return false;
    }
    spdlog::info("Sampler reset from CRASHED");
    return true;
}

bool SamplerDaemon::sample_once() {
    DaemonState current = state_.load();
    if (current != DaemonState::RUNNING && current != DaemonState::STOPPING) {
        return false;
    }

    std::optional<metrics::SystemSample> sample;
    try {
        sample = source_->sample();
    } catch (const std::exception& e) {
        spdlog::error("Sample collection failed: {}", e.what());
        return false;
    }
    if (!sample) {
        return false;
    }

    int64_t ts = core::to_epoch_ms(sample->timestamp);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (ts <= last_sample_ms_) {
            spdlog::warn("Sample at {} not after previous sample at {}, dropped", ts, last_sample_ms_);
            return false;
        }
        last_sample_ms_ = ts;
    }

    check_thresholds(*sample);
    if (!buffer_.push(std::move(*sample))) {
        spdlog::debug("Sample buffer full, oldest sample evicted");
    }
    return true;
}

bool SamplerDaemon::flush() {
    DaemonState current = state_.load();
    if (current != DaemonState::RUNNING && current != DaemonState::STOPPING) {
        return false;
    }

    bool ok = true;
    auto batch = buffer_.drain();
    if (!batch.empty()) {
        if (files_.write_batch(batch)) {
            std::lock_guard<std::mutex> lock(status_mutex_);
            last_flush_ms_ = now_ms();
        } else {
            spdlog::error("Failed to flush {} samples, retrying at next flush", batch.size());
            for (auto& sample : batch) {
                buffer_.push(std::move(sample));
            }
            ok = false;
        }
    }

    auto retention = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(config_.retention_hours * 3600.0));
    auto pruned = files_.prune(std::chrono::system_clock::now() - retention);
    if (pruned.failed > 0) {
        spdlog::warn("{} expired metric files could not be removed", pruned.failed);
    }

    write_status();
    return ok;
}

void SamplerDaemon::drain_and_stop() {
    set_state(DaemonState::STOPPING);
    write_status();
    flush();
    set_state(DaemonState::STOPPED);
    write_status();
    lock_.release();
}

void SamplerDaemon::check_thresholds(const metrics::SystemSample& sample) {
    std::lock_guard<std::mutex> lock(status_mutex_);

    if (sample.cpu_percent > config_.cpu_alert_threshold) {
        if (!cpu_alert_active_) {
            spdlog::warn("High CPU usage: {:.1f}% (threshold {:.1f}%)",
                         sample.cpu_percent, config_.cpu_alert_threshold);
            cpu_alert_active_ = true;
            ++alert_count_;
        }
    } else if (cpu_alert_active_) {
        spdlog::info("CPU usage back to {:.1f}%", sample.cpu_percent);
        cpu_alert_active_ = false;
    }

    if (sample.memory_percent > config_.memory_alert_threshold) {
        if (!memory_alert_active_) {
            spdlog::warn("High memory usage: {:.1f}% (threshold {:.1f}%)",
                         sample.memory_percent, config_.memory_alert_threshold);
            memory_alert_active_ = true;
            ++alert_count_;
        }
    } else if (memory_alert_active_) {
        spdlog::info("Memory usage back to {:.1f}%", sample.memory_percent);
        memory_alert_active_ = false;
    }
}

DaemonStatus SamplerDaemon::status() const {
    DaemonStatus status;
    status.state = state_.load();
    status.pid = getpid();
    status.data_dir = data_dir_.string();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status.started_at_ms = started_at_ms_;
        status.last_sample_ms = last_sample_ms_;
        status.last_flush_ms = last_flush_ms_;
    }
    status.samples_buffered = buffer_.size();
    status.samples_dropped = buffer_.dropped();
    status.metric_file_count = files_.file_count();
    return status;
}

void SamplerDaemon::write_status() {
    if (!core::paths::write_file_atomic(data_dir_ / kStatusFile, status().to_json().dump(2))) {
        spdlog::warn("Failed to update sampler status in {}", data_dir_.string());
    }
}

// ============================================================================
// Out-of-process control
// ============================================================================

std::optional<DaemonStatus> read_daemon_status(const fs::path& data_dir) {
    fs::path dir = core::paths::expand_user(data_dir.string());
    std::ifstream in(dir / kStatusFile);
    if (!in) {
        spdlog::debug("No sampler status in {}", dir.string());
        return std::nullopt;
    }

    DaemonStatus status;
    try {
        status = DaemonStatus::from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable sampler status in {}: {}", dir.string(), e.what());
        return std::nullopt;
    }

    bool claims_alive = status.state == DaemonState::STARTING ||
                        status.state == DaemonState::RUNNING ||
                        status.state == DaemonState::STOPPING;
    if (claims_alive && !InstanceLock::is_locked(dir / kLockFile)) {
        status.state = DaemonState::CRASHED;
    }
    return status;
}

bool signal_daemon_stop(const fs::path& data_dir) {
    fs::path lock_path = core::paths::expand_user(data_dir.string()) / kLockFile;
    if (!InstanceLock::is_locked(lock_path)) {
        spdlog::info("No sampler running for {}", data_dir.string());
        return false;
    }
    auto pid = InstanceLock::read_pid(lock_path);
    if (!pid) {
        spdlog::error("Sampler lock {} has no pid", lock_path.string());
        return false;
    }
    if (kill(*pid, SIGTERM) != 0) {
        spdlog::error("Failed to signal sampler pid {}: {}", *pid, strerror(errno));
        return false;
    }
    spdlog::info("Sent SIGTERM to sampler pid {}", *pid);
    return true;
}

} // namespace clockwork::sampler
