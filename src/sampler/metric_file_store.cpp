#include "sampler/metric_file_store.hpp"
#include "core/clock.hpp"
#include "core/paths.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace clockwork::sampler {

namespace {

constexpr const char* kFilePrefix = "metrics-";
constexpr const char* kSubdir = "metrics";

std::string file_name(int64_t first_ms, int64_t last_ms, int sequence) {
    char name[96];
    if (sequence == 0) {
        std::snprintf(name, sizeof(name), "%s%015lld-%015lld.json", kFilePrefix,
                      static_cast<long long>(first_ms), static_cast<long long>(last_ms));
    } else {
        std::snprintf(name, sizeof(name), "%s%015lld-%015lld-%d.json", kFilePrefix,
                      static_cast<long long>(first_ms), static_cast<long long>(last_ms), sequence);
    }
    return name;
}

} // namespace

MetricFileStore::MetricFileStore(const fs::path& data_dir)
    : dir_(data_dir / kSubdir) {}

std::optional<fs::path> MetricFileStore::write_batch(const std::vector<metrics::SystemSample>& samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    if (!core::paths::ensure_directory(dir_)) {
        return std::nullopt;
    }

    int64_t first_ms = core::to_epoch_ms(samples.front().timestamp);
    int64_t last_ms = core::to_epoch_ms(samples.back().timestamp);

    nlohmann::json doc{
        {"first_ms", first_ms},
        {"last_ms", last_ms},
        {"sample_count", samples.size()},
        {"samples", nlohmann::json::array()}
    };
    for (const auto& sample : samples) {
        doc["samples"].push_back(sample.to_json());
    }

    // Never replace an existing batch
    fs::path path;
    std::error_code ec;
    for (int sequence = 0;; ++sequence) {
        path = dir_ / file_name(first_ms, last_ms, sequence);
        if (!fs::exists(path, ec)) break;
    }

    if (!core::paths::write_file_atomic(path, doc.dump())) {
        return std::nullopt;
    }
    spdlog::debug("Wrote {} samples to {}", samples.size(), path.string());
    return path;
}

std::optional<MetricFileInfo> MetricFileStore::parse_name(const fs::path& file) {
    const std::string name = file.filename().string();
    if (name.rfind(kFilePrefix, 0) != 0 || file.extension() != ".json") {
        return std::nullopt;
    }
    long long first = 0;
    long long last = 0;
    if (std::sscanf(name.c_str() + std::strlen(kFilePrefix), "%lld-%lld", &first, &last) != 2) {
        return std::nullopt;
    }
    MetricFileInfo info;
    info.path = file;
    info.first_ms = first;
    info.last_ms = last;
    return info;
}

std::vector<MetricFileInfo> MetricFileStore::list_files() const {
    std::vector<MetricFileInfo> files;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (auto info = parse_name(entry.path())) {
            files.push_back(std::move(*info));
        }
    }
    std::sort(files.begin(), files.end(),
              [](const MetricFileInfo& a, const MetricFileInfo& b) {
                  if (a.first_ms != b.first_ms) return a.first_ms < b.first_ms;
                  return a.path.filename().string() < b.path.filename().string();
              });
    return files;
}

std::optional<std::vector<metrics::SystemSample>> MetricFileStore::read_file(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        spdlog::warn("Cannot open metric file {}", file.string());
        return std::nullopt;
    }
    try {
        auto doc = nlohmann::json::parse(in);
        std::vector<metrics::SystemSample> samples;
        if (doc.contains("samples") && doc["samples"].is_array()) {
            for (const auto& item : doc["samples"]) {
                samples.push_back(metrics::SystemSample::from_json(item));
            }
        }
        return samples;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable metric file {}: {}", file.string(), e.what());
        return std::nullopt;
    }
}

std::vector<metrics::SystemSample> MetricFileStore::read_window(
        std::chrono::system_clock::time_point start,
        std::chrono::system_clock::time_point end) const {
    std::vector<metrics::SystemSample> samples;
    if (end < start) {
        return samples;
    }
    int64_t start_ms = core::to_epoch_ms(start);
    int64_t end_ms = core::to_epoch_ms(end);

    for (const auto& info : list_files()) {
        if (info.last_ms < start_ms || info.first_ms > end_ms) continue;

        auto batch = read_file(info.path);
        if (!batch) continue;
        for (auto& sample : *batch) {
            int64_t ts = core::to_epoch_ms(sample.timestamp);
            if (ts >= start_ms && ts <= end_ms) {
                samples.push_back(std::move(sample));
            }
        }
    }
    std::stable_sort(samples.begin(), samples.end(),
                     [](const metrics::SystemSample& a, const metrics::SystemSample& b) {
                         return a.timestamp < b.timestamp;
                     });
    return samples;
}

PruneResult MetricFileStore::prune(std::chrono::system_clock::time_point cutoff) {
    PruneResult result;
    int64_t cutoff_ms = core::to_epoch_ms(cutoff);

    for (const auto& info : list_files()) {
        if (info.last_ms >= cutoff_ms) {
            ++result.kept;
            continue;
        }
        std::error_code ec;
        fs::remove(info.path, ec);
        if (ec) {
            spdlog::warn("Failed to prune {}: {}", info.path.string(), ec.message());
            ++result.failed;
        } else {
            ++result.deleted;
        }
    }
    if (result.deleted > 0) {
        spdlog::info("Pruned {} metric files older than {}", result.deleted,
                     core::format_iso8601(cutoff));
    }
    return result;
}

} // namespace clockwork::sampler
