#include "correlate/correlator.hpp"
#include "core/clock.hpp"
#include "core/paths.hpp"
#include "sampler/metric_file_store.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace clockwork::correlate {

namespace {

std::chrono::system_clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(seconds));
}

} // namespace

nlohmann::json SystemLoad::to_json() const {
    return nlohmann::json{
        {"avg_cpu_percent", avg_cpu_percent},
        {"max_cpu_percent", max_cpu_percent},
        {"avg_memory_percent", avg_memory_percent},
        {"max_memory_percent", max_memory_percent},
        {"samples_matched", samples_matched}
    };
}

nlohmann::json CorrelationReport::to_json() const {
    nlohmann::json j{
        {"window_start_ms", core::to_epoch_ms(window_start)},
        {"window_end_ms", core::to_epoch_ms(window_end)},
        {"daemon_available", daemon_available},
        {"functions", nlohmann::json::object()},
        {"calls", nlohmann::json::array()}
    };
    for (const auto& [name, entry] : functions) {
        nlohmann::json fn = entry.summary.to_json();
        if (entry.load) {
            fn["system_load"] = entry.load->to_json();
        }
        j["functions"][name] = std::move(fn);
    }
    if (overall) {
        j["system_load"] = overall->to_json();
    }
    for (const auto& call : calls) {
        nlohmann::json item = call.record.to_json();
        if (call.sample) {
            item["sample"] = call.sample->to_json();
        }
        j["calls"].push_back(std::move(item));
    }
    return j;
}

Correlator::Correlator(tracker::CorrelationConfig config)
    : config_(std::move(config))
    , sampler_dir_(core::paths::expand_user(config_.sampler_data_dir)) {}

std::vector<CorrelatedCall> Correlator::join(const std::vector<tracker::CallRecord>& records,
                                             const std::vector<metrics::SystemSample>& samples,
                                             std::chrono::system_clock::duration max_age) {
    std::vector<CorrelatedCall> joined;
    joined.reserve(records.size());

    for (const auto& record : records) {
        CorrelatedCall call;
        call.record = record;

        // First sample strictly after the call; the one before it is the match
        auto after = std::upper_bound(samples.begin(), samples.end(), record.timestamp,
            [](std::chrono::system_clock::time_point t, const metrics::SystemSample& s) {
                return t < s.timestamp;
            });
        if (after != samples.begin()) {
            const auto& nearest = *std::prev(after);
            if (record.timestamp - nearest.timestamp <= max_age) {
                call.sample = nearest;
            }
        }
        joined.push_back(std::move(call));
    }
    return joined;
}

std::optional<SystemLoad> Correlator::load_of(const std::vector<const metrics::SystemSample*>& samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    SystemLoad load;
    double cpu_total = 0.0;
    double mem_total = 0.0;
    load.max_cpu_percent = samples.front()->cpu_percent;
    load.max_memory_percent = samples.front()->memory_percent;
    for (const auto* sample : samples) {
        cpu_total += sample->cpu_percent;
        mem_total += sample->memory_percent;
        load.max_cpu_percent = std::max(load.max_cpu_percent, sample->cpu_percent);
        load.max_memory_percent = std::max(load.max_memory_percent, sample->memory_percent);
    }
    load.samples_matched = samples.size();
    load.avg_cpu_percent = cpu_total / samples.size();
    load.avg_memory_percent = mem_total / samples.size();
    return load;
}

CorrelationReport Correlator::correlate(const tracker::AggregationStore& store,
                                        std::chrono::system_clock::time_point start,
                                        std::chrono::system_clock::time_point end) const {
    sampler::MetricFileStore files(sampler_dir_);
    auto samples = files.read_window(start - seconds_to_duration(config_.lookback_secs), end);
    if (samples.empty()) {
        spdlog::debug("No sampler data in {} for the requested window", files.directory().string());
    }
    return correlate(store.all_records(), samples, start, end);
}

CorrelationReport Correlator::correlate(const std::vector<tracker::CallRecord>& records,
                                        const std::vector<metrics::SystemSample>& samples,
                                        std::chrono::system_clock::time_point start,
                                        std::chrono::system_clock::time_point end) const {
    CorrelationReport report;
    report.window_start = start;
    report.window_end = end;
    report.daemon_available = !samples.empty();

    std::vector<tracker::CallRecord> in_window;
    for (const auto& record : records) {
        if (record.timestamp >= start && record.timestamp <= end) {
            in_window.push_back(record);
        }
    }
    std::stable_sort(in_window.begin(), in_window.end(),
                     [](const tracker::CallRecord& a, const tracker::CallRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    report.calls = join(in_window, samples, seconds_to_duration(config_.max_sample_age_secs));

    std::map<std::string, std::vector<tracker::CallRecord>> by_function;
    std::map<std::string, std::vector<const metrics::SystemSample*>> samples_by_function;
    std::vector<const metrics::SystemSample*> all_matched;
    for (const auto& call : report.calls) {
        by_function[call.record.qualified_name].push_back(call.record);
        if (call.sample) {
            samples_by_function[call.record.qualified_name].push_back(&*call.sample);
            all_matched.push_back(&*call.sample);
        }
    }

    for (const auto& [name, fn_records] : by_function) {
        FunctionCorrelation entry;
        entry.summary = tracker::summarize(name, fn_records);
        auto it = samples_by_function.find(name);
        if (it != samples_by_function.end()) {
            entry.load = load_of(it->second);
        }
        report.functions.emplace(name, std::move(entry));
    }
    report.overall = load_of(all_matched);
    return report;
}

} // namespace clockwork::correlate
