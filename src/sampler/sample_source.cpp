#include "sampler/sample_source.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace clockwork::sampler {

ProcSampleSource::ProcSampleSource(const SamplerConfig& config)
    : include_network_(config.enable_network_monitoring)
    , process_patterns_(config.track_process_patterns)
    , pids_(config.track_pids) {}

std::optional<metrics::SystemSample> ProcSampleSource::sample() {
    auto sample = collector_.collect_system(include_network_);
    if (sample.memory_total_bytes == 0) {
        spdlog::warn("Failed to read /proc/meminfo, skipping sample");
        return std::nullopt;
    }

    if (process_patterns_.empty() && pids_.empty()) {
        return sample;
    }

    std::vector<pid_t> targets = collector_.find_processes(process_patterns_);
    targets.insert(targets.end(), pids_.begin(), pids_.end());
    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());

    std::vector<metrics::ProcessSample> processes;
    for (pid_t pid : targets) {
        if (auto proc = collector_.collect_process(pid)) {
            processes.push_back(std::move(*proc));
        }
    }
    collector_.retain_processes(targets);
    sample.processes = std::move(processes);
    return sample;
}

} // namespace clockwork::sampler
