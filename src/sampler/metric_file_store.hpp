#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "metrics/metrics.hpp"

namespace clockwork::sampler {

struct MetricFileInfo {
    std::filesystem::path path;
    int64_t first_ms = 0;       // oldest sample in the file
    int64_t last_ms = 0;        // newest sample in the file
};

struct PruneResult {
    size_t deleted = 0;
    size_t failed = 0;          // left in place for the next sweep
    size_t kept = 0;
};

/**
 * Rotating on-disk store of flushed sample batches.
 *
 * Files live under <data_dir>/metrics and are named
 * "metrics-<first_ms>-<last_ms>.json" with zero-padded timestamps, so
 * listing and window selection never parse file contents. Every file is
 * written to a temp name and renamed into place.
 */
class MetricFileStore {
public:
    explicit MetricFileStore(const std::filesystem::path& data_dir);

    // Write one batch; returns the new file, nullopt on failure (logged).
    // An empty batch writes nothing and returns nullopt.
    std::optional<std::filesystem::path> write_batch(const std::vector<metrics::SystemSample>& samples);

    // Metric files ordered by first sample time
    std::vector<MetricFileInfo> list_files() const;

    // Samples overlapping [start, end], ordered by timestamp
    std::vector<metrics::SystemSample> read_window(std::chrono::system_clock::time_point start,
                                                   std::chrono::system_clock::time_point end) const;

    // Delete every file whose newest sample is older than cutoff
    PruneResult prune(std::chrono::system_clock::time_point cutoff);

    size_t file_count() const { return list_files().size(); }
    const std::filesystem::path& directory() const { return dir_; }

    static std::optional<std::vector<metrics::SystemSample>> read_file(const std::filesystem::path& file);
    static std::optional<MetricFileInfo> parse_name(const std::filesystem::path& file);

private:
    std::filesystem::path dir_;
};

} // namespace clockwork::sampler
