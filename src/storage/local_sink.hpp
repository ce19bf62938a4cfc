#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "storage/sink.hpp"
#include "tracker/config.hpp"

namespace clockwork::storage {

/**
 * Writes one file per flush under a directory.
 *
 * File names are "perf-<epoch_us>-<session prefix>.<ext>" with a zero-padded
 * timestamp, so lexical order is flush order. Once the number of records
 * across all files exceeds max_records the oldest files are deleted first;
 * the newest file is always kept.
 */
class LocalSink : public Sink {
public:
    explicit LocalSink(tracker::LocalStorageConfig config);

    DeliveryResult write(const std::string& session_id,
                         const std::vector<tracker::CallRecord>& records,
                         const FlushMetadata& metadata) override;

    const char* name() const override { return "local"; }

    // Flush files, oldest first
    std::vector<std::filesystem::path> list_files() const;

    // Records stored across all flush files
    size_t total_records() const;

    // Records in one flush file; nullopt if unreadable
    static std::optional<size_t> count_records(const std::filesystem::path& file);

    // Records in one flush file (JSON or CSV)
    static std::vector<tracker::CallRecord> read_records(const std::filesystem::path& file);

    const std::filesystem::path& directory() const { return dir_; }

private:
    tracker::LocalStorageConfig config_;
    std::filesystem::path dir_;
    int64_t last_stamp_us_ = 0;
    std::mutex mutex_;

    std::filesystem::path next_path(const std::string& session_id);
    std::string encode_csv(const std::string& session_id,
                           const std::vector<tracker::CallRecord>& records,
                           const FlushMetadata& metadata) const;
    void enforce_record_cap();
};

} // namespace clockwork::storage
