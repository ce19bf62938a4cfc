#pragma once
#include <memory>
#include <optional>
#include "metrics/metrics.hpp"
#include "sampler/config.hpp"

namespace clockwork::sampler {

// Produces one System Sample per sampler tick.
class SampleSource {
public:
    virtual ~SampleSource() = default;

    // nullopt when the reading failed; the tick is skipped
    virtual std::optional<metrics::SystemSample> sample() = 0;
};

// Reads the local machine through /proc.
class ProcSampleSource : public SampleSource {
public:
    explicit ProcSampleSource(const SamplerConfig& config);

    std::optional<metrics::SystemSample> sample() override;

private:
    bool include_network_;
    std::vector<std::string> process_patterns_;
    std::vector<pid_t> pids_;
    metrics::MetricsCollector collector_;
};

} // namespace clockwork::sampler
