/**
 * clockwork system metrics
 *
 * Whole-system and per-process resource readings taken by the sampler.
 * Linux only: values come from /proc.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <unordered_map>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace clockwork::metrics {

/**
 * Cumulative counters of one network interface
 */
struct InterfaceCounters {
    std::string name;
    uint64_t bytes_sent = 0;
    uint64_t bytes_recv = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_recv = 0;
    uint64_t errors_in = 0;
    uint64_t errors_out = 0;

    nlohmann::json to_json() const;
    static InterfaceCounters from_json(const nlohmann::json& j);
};

/**
 * One tracked process at sample time
 */
struct ProcessSample {
    pid_t pid = 0;
    std::string name;
    double cpu_percent = 0.0;
    uint64_t rss_bytes = 0;

    nlohmann::json to_json() const;
    static ProcessSample from_json(const nlohmann::json& j);
};

/**
 * One sampler tick
 */
struct SystemSample {
    std::chrono::system_clock::time_point timestamp;

    double cpu_percent = 0.0;               // Overall CPU usage (0-100)
    double memory_percent = 0.0;
    uint64_t memory_used_bytes = 0;         // total - available
    uint64_t memory_total_bytes = 0;
    double load_avg_1m = 0.0;

    std::optional<std::vector<InterfaceCounters>> network;
    std::optional<std::vector<ProcessSample>> processes;

    nlohmann::json to_json() const;
    static SystemSample from_json(const nlohmann::json& j);
};

/**
 * Metrics collector
 *
 * Reads /proc/stat, /proc/meminfo, /proc/loadavg, /proc/net/dev and
 * /proc/<pid>/stat. CPU percentages are deltas against the previous call,
 * so the first reading after construction covers the time since then.
 */
class MetricsCollector {
public:
    MetricsCollector();
    ~MetricsCollector();

    // Disable copy
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    /**
     * Collect system-wide metrics
     * @param include_network Read per-interface counters (loopback skipped)
     */
    SystemSample collect_system(bool include_network);

    /**
     * Collect metrics for a specific process
     * @param pid Process ID
     * @return ProcessSample or nullopt if process doesn't exist
     */
    std::optional<ProcessSample> collect_process(pid_t pid);

    /**
     * Pids of processes whose name contains any of the given substrings
     */
    std::vector<pid_t> find_processes(const std::vector<std::string>& name_patterns);

    /**
     * Drop per-process CPU state for pids not in the given set
     */
    void retain_processes(const std::vector<pid_t>& pids);

    int get_cpu_count() const { return cpu_count_; }

private:
    // CPU calculation state
    int cpu_count_;
    uint64_t prev_cpu_total_ = 0;
    uint64_t prev_cpu_idle_ = 0;

    // Per-process CPU tracking
    struct ProcessCpuState {
        uint64_t prev_utime = 0;
        uint64_t prev_stime = 0;
        std::chrono::steady_clock::time_point prev_time;
    };
    std::unordered_map<pid_t, ProcessCpuState> process_cpu_state_;

    // Helper methods
    bool read_cpu_stats(uint64_t& total, uint64_t& idle);
    void read_meminfo(SystemSample& sample);
    void read_loadavg(SystemSample& sample);
    std::vector<InterfaceCounters> read_netdev();

    std::string read_file(const std::string& path);
    std::vector<std::string> read_file_lines(const std::string& path);
    uint64_t parse_uint64(const std::string& str, uint64_t default_val = 0);
};

} // namespace clockwork::metrics
