#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "metrics/metrics.hpp"
#include "tracker/aggregation_store.hpp"
#include "tracker/config.hpp"
#include "tracker/types.hpp"

namespace clockwork::correlate {

// CPU and memory load over the samples attached to a set of calls.
struct SystemLoad {
    double avg_cpu_percent = 0.0;
    double max_cpu_percent = 0.0;
    double avg_memory_percent = 0.0;
    double max_memory_percent = 0.0;
    size_t samples_matched = 0;

    nlohmann::json to_json() const;
};

struct CorrelatedCall {
    tracker::CallRecord record;
    std::optional<metrics::SystemSample> sample;    // nearest not after the call
};

struct FunctionCorrelation {
    tracker::FunctionSummary summary;
    std::optional<SystemLoad> load;                 // absent without samples
};

struct CorrelationReport {
    std::chrono::system_clock::time_point window_start;
    std::chrono::system_clock::time_point window_end;
    bool daemon_available = false;                  // samples found in the window
    std::map<std::string, FunctionCorrelation> functions;
    std::optional<SystemLoad> overall;
    std::vector<CorrelatedCall> calls;

    nlohmann::json to_json() const;
};

/**
 * Joins call records with sampler output.
 *
 * Each record is paired with the latest sample taken at or before its
 * completion time, as long as that sample is no older than
 * max_sample_age. Reads Metric Files only; never modifies them or the store.
 */
class Correlator {
public:
    explicit Correlator(tracker::CorrelationConfig config);

    CorrelationReport correlate(const tracker::AggregationStore& store,
                                std::chrono::system_clock::time_point start,
                                std::chrono::system_clock::time_point end) const;

    // Report over records and samples already in memory
    CorrelationReport correlate(const std::vector<tracker::CallRecord>& records,
                                const std::vector<metrics::SystemSample>& samples,
                                std::chrono::system_clock::time_point start,
                                std::chrono::system_clock::time_point end) const;

    // samples must be ordered by timestamp
    static std::vector<CorrelatedCall> join(const std::vector<tracker::CallRecord>& records,
                                            const std::vector<metrics::SystemSample>& samples,
                                            std::chrono::system_clock::duration max_age);

    static std::optional<SystemLoad> load_of(const std::vector<const metrics::SystemSample*>& samples);

private:
    tracker::CorrelationConfig config_;
    std::filesystem::path sampler_dir_;
};

} // namespace clockwork::correlate
