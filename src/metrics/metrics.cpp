/**
 * clockwork system metrics - Implementation
 *
 * Reads metrics from the Linux /proc filesystem.
 */

#include "metrics/metrics.hpp"
#include "core/clock.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <unistd.h>

namespace fs = std::filesystem;

namespace clockwork::metrics {

// ============================================================================
// JSON Conversion
// ============================================================================

nlohmann::json InterfaceCounters::to_json() const {
    return nlohmann::json{
        {"name", name},
        {"bytes_sent", bytes_sent},
        {"bytes_recv", bytes_recv},
        {"packets_sent", packets_sent},
        {"packets_recv", packets_recv},
        {"errors_in", errors_in},
        {"errors_out", errors_out}
    };
}

InterfaceCounters InterfaceCounters::from_json(const nlohmann::json& j) {
    InterfaceCounters c;
    c.name = j.value("name", "");
    c.bytes_sent = j.value("bytes_sent", uint64_t{0});
    c.bytes_recv = j.value("bytes_recv", uint64_t{0});
    c.packets_sent = j.value("packets_sent", uint64_t{0});
    c.packets_recv = j.value("packets_recv", uint64_t{0});
    c.errors_in = j.value("errors_in", uint64_t{0});
    c.errors_out = j.value("errors_out", uint64_t{0});
    return c;
}

nlohmann::json ProcessSample::to_json() const {
    return nlohmann::json{
        {"pid", pid},
        {"name", name},
        {"cpu_percent", cpu_percent},
        {"rss_bytes", rss_bytes}
    };
}

ProcessSample ProcessSample::from_json(const nlohmann::json& j) {
    ProcessSample p;
    p.pid = j.value("pid", 0);
    p.name = j.value("name", "");
    p.cpu_percent = j.value("cpu_percent", 0.0);
    p.rss_bytes = j.value("rss_bytes", uint64_t{0});
    return p;
}

nlohmann::json SystemSample::to_json() const {
    // Rounded up so a stored sample never reads back earlier than it was taken
    int64_t timestamp_us = std::chrono::ceil<std::chrono::microseconds>(timestamp.time_since_epoch()).count();
    nlohmann::json j{
        {"timestamp_us", timestamp_us},
        {"timestamp_ms", core::to_epoch_ms(timestamp)},
        {"cpu_percent", cpu_percent},
        {"memory", {
            {"percent", memory_percent},
            {"used", memory_used_bytes},
            {"total", memory_total_bytes}
        }},
        {"load_avg_1m", load_avg_1m}
    };
    if (network) {
        nlohmann::json ifaces = nlohmann::json::array();
        for (const auto& iface : *network) {
            ifaces.push_back(iface.to_json());
        }
        j["network"] = std::move(ifaces);
    }
    if (processes) {
        nlohmann::json procs = nlohmann::json::array();
        for (const auto& proc : *processes) {
            procs.push_back(proc.to_json());
        }
        j["processes"] = std::move(procs);
    }
    return j;
}

SystemSample SystemSample::from_json(const nlohmann::json& j) {
    SystemSample s;
    if (j.contains("timestamp_us")) {
        s.timestamp = core::from_epoch_us(j.value("timestamp_us", int64_t{0}));
    } else {
        s.timestamp = core::from_epoch_ms(j.value("timestamp_ms", int64_t{0}));
    }
    s.cpu_percent = j.value("cpu_percent", 0.0);
    if (j.contains("memory") && j["memory"].is_object()) {
        const auto& mem = j["memory"];
        s.memory_percent = mem.value("percent", 0.0);
        s.memory_used_bytes = mem.value("used", uint64_t{0});
        s.memory_total_bytes = mem.value("total", uint64_t{0});
    }
    s.load_avg_1m = j.value("load_avg_1m", 0.0);
    if (j.contains("network") && j["network"].is_array()) {
        std::vector<InterfaceCounters> ifaces;
        for (const auto& item : j["network"]) {
            ifaces.push_back(InterfaceCounters::from_json(item));
        }
        s.network = std::move(ifaces);
    }
    if (j.contains("processes") && j["processes"].is_array()) {
        std::vector<ProcessSample> procs;
        for (const auto& item : j["processes"]) {
            procs.push_back(ProcessSample::from_json(item));
        }
        s.processes = std::move(procs);
    }
    return s;
}

// ============================================================================
// MetricsCollector Implementation
// ============================================================================

MetricsCollector::MetricsCollector() {
    cpu_count_ = static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN));
    if (cpu_count_ < 1) cpu_count_ = 1;

    // Baseline for the first delta
    if (!read_cpu_stats(prev_cpu_total_, prev_cpu_idle_)) {
        prev_cpu_total_ = 0;
        prev_cpu_idle_ = 0;
    }
}

MetricsCollector::~MetricsCollector() = default;

std::string MetricsCollector::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> MetricsCollector::read_file_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file) return lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

uint64_t MetricsCollector::parse_uint64(const std::string& str, uint64_t default_val) {
    try {
        return std::stoull(str);
    } catch (const std::exception&) {
        return default_val;
    }
}

bool MetricsCollector::read_cpu_stats(uint64_t& total, uint64_t& idle) {
    auto lines = read_file_lines("/proc/stat");
    for (const auto& line : lines) {
        if (line.compare(0, 4, "cpu ") != 0) continue;

        std::istringstream iss(line);
        std::string cpu_name;
        uint64_t user = 0, nice = 0, system = 0, idle_val = 0, iowait = 0;
        uint64_t irq = 0, softirq = 0, steal = 0;
        iss >> cpu_name >> user >> nice >> system >> idle_val >> iowait >> irq >> softirq >> steal;
        if (!iss && !iss.eof()) return false;

        total = user + nice + system + idle_val + iowait + irq + softirq + steal;
        idle = idle_val + iowait;
        return true;
    }
    return false;
}

void MetricsCollector::read_meminfo(SystemSample& sample) {
    auto lines = read_file_lines("/proc/meminfo");
    uint64_t available = 0;

    for (const auto& line : lines) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        iss >> key >> value;

        // Values are in kB, convert to bytes
        value *= 1024;

        if (key == "MemTotal:") sample.memory_total_bytes = value;
        else if (key == "MemAvailable:") available = value;
    }

    sample.memory_used_bytes = sample.memory_total_bytes > available ?
        sample.memory_total_bytes - available : 0;
    sample.memory_percent = sample.memory_total_bytes > 0 ?
        100.0 * sample.memory_used_bytes / sample.memory_total_bytes : 0.0;
}

void MetricsCollector::read_loadavg(SystemSample& sample) {
    std::string content = read_file("/proc/loadavg");
    std::istringstream iss(content);
    iss >> sample.load_avg_1m;
}

std::vector<InterfaceCounters> MetricsCollector::read_netdev() {
    std::vector<InterfaceCounters> result;
    auto lines = read_file_lines("/proc/net/dev");

    for (size_t i = 2; i < lines.size(); ++i) {  // Skip header lines
        std::string line = lines[i];
        // Replace ':' with space for easier parsing
        std::replace(line.begin(), line.end(), ':', ' ');

        std::istringstream iss(line);
        std::string iface;
        uint64_t rx_bytes, rx_packets, rx_errs, rx_drop, rx_fifo, rx_frame, rx_compressed, rx_multicast;
        uint64_t tx_bytes, tx_packets, tx_errs;

        iss >> iface >> rx_bytes >> rx_packets >> rx_errs >> rx_drop >> rx_fifo >> rx_frame >> rx_compressed >> rx_multicast
            >> tx_bytes >> tx_packets >> tx_errs;
        if (!iss) continue;

        // Skip loopback
        if (iface == "lo") continue;

        InterfaceCounters counters;
        counters.name = iface;
        counters.bytes_recv = rx_bytes;
        counters.bytes_sent = tx_bytes;
        counters.packets_recv = rx_packets;
        counters.packets_sent = tx_packets;
        counters.errors_in = rx_errs;
        counters.errors_out = tx_errs;
        result.push_back(std::move(counters));
    }
    return result;
}

SystemSample MetricsCollector::collect_system(bool include_network) {
    SystemSample sample;
    sample.timestamp = std::chrono::system_clock::now();

    uint64_t cpu_total = 0, cpu_idle = 0;
    if (read_cpu_stats(cpu_total, cpu_idle)) {
        uint64_t total_diff = cpu_total - prev_cpu_total_;
        uint64_t idle_diff = cpu_idle - prev_cpu_idle_;

        if (total_diff > 0 && cpu_total >= prev_cpu_total_) {
            sample.cpu_percent = 100.0 * (1.0 - static_cast<double>(idle_diff) / total_diff);
        }
        prev_cpu_total_ = cpu_total;
        prev_cpu_idle_ = cpu_idle;
    }

    read_meminfo(sample);
    read_loadavg(sample);

    if (include_network) {
        sample.network = read_netdev();
    }

    return sample;
}

std::optional<ProcessSample> MetricsCollector::collect_process(pid_t pid) {
    std::string proc_path = "/proc/" + std::to_string(pid);

    std::error_code ec;
    if (!fs::exists(proc_path, ec)) {
        return std::nullopt;
    }

    ProcessSample sample;
    sample.pid = pid;

    std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    // comm can contain spaces and parentheses; the last ')' ends it
    size_t comm_end = stat_content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 > stat_content.size()) {
        return std::nullopt;
    }
    size_t comm_start = stat_content.find('(');
    if (comm_start != std::string::npos && comm_end > comm_start) {
        sample.name = stat_content.substr(comm_start + 1, comm_end - comm_start - 1);
    }

    std::istringstream iss(stat_content.substr(comm_end + 2));
    char state;
    int ppid, pgrp, session, tty_nr, tpgid;
    unsigned int flags;
    uint64_t minflt, cminflt, majflt, cmajflt, utime, stime;
    int64_t cutime, cstime, priority, nice;
    int64_t num_threads, itrealvalue;
    uint64_t starttime, vsize, rss;

    iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> utime >> stime
        >> cutime >> cstime >> priority >> nice >> num_threads >> itrealvalue
        >> starttime >> vsize >> rss;
    if (!iss) return std::nullopt;

    sample.rss_bytes = rss * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));

    auto now = std::chrono::steady_clock::now();
    auto& cpu_state = process_cpu_state_[pid];

    if (cpu_state.prev_time.time_since_epoch().count() > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - cpu_state.prev_time).count();
        uint64_t prev_total = cpu_state.prev_utime + cpu_state.prev_stime;
        if (elapsed > 0 && utime + stime >= prev_total) {
            long ticks_per_sec = sysconf(_SC_CLK_TCK);
            double time_diff_ms = ((utime + stime - prev_total) * 1000.0) / ticks_per_sec;
            sample.cpu_percent = 100.0 * time_diff_ms / elapsed;
        }
    }

    cpu_state.prev_utime = utime;
    cpu_state.prev_stime = stime;
    cpu_state.prev_time = now;

    return sample;
}

std::vector<pid_t> MetricsCollector::find_processes(const std::vector<std::string>& name_patterns) {
    std::vector<pid_t> pids;
    if (name_patterns.empty()) return pids;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const std::string dirname = entry.path().filename().string();
        if (dirname.empty() || !std::all_of(dirname.begin(), dirname.end(),
                                            [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }

        std::string comm = read_file(entry.path().string() + "/comm");
        if (!comm.empty() && comm.back() == '\n') comm.pop_back();
        if (comm.empty()) continue;

        for (const auto& pattern : name_patterns) {
            if (comm.find(pattern) != std::string::npos) {
                pids.push_back(static_cast<pid_t>(parse_uint64(dirname)));
                break;
            }
        }
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

void MetricsCollector::retain_processes(const std::vector<pid_t>& pids) {
    for (auto it = process_cpu_state_.begin(); it != process_cpu_state_.end();) {
        if (std::find(pids.begin(), pids.end(), it->first) == pids.end()) {
            it = process_cpu_state_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace clockwork::metrics
