#include "storage/local_sink.hpp"
#include "core/clock.hpp"
#include "core/paths.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace clockwork::storage {

namespace {

constexpr const char* kFilePrefix = "perf-";

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Split one CSV line honoring double-quoted fields.
std::vector<std::string> csv_split(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

bool is_flush_file(const fs::path& path) {
    auto name = path.filename().string();
    auto ext = path.extension().string();
    return name.rfind(kFilePrefix, 0) == 0 && (ext == ".json" || ext == ".csv");
}

} // namespace

LocalSink::LocalSink(tracker::LocalStorageConfig config)
    : config_(std::move(config))
    , dir_(core::paths::expand_user(config_.data_dir)) {}

DeliveryResult LocalSink::write(const std::string& session_id,
                                const std::vector<tracker::CallRecord>& records,
                                const FlushMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!core::paths::ensure_directory(dir_)) {
        return DeliveryResult::permanent("cannot create directory " + dir_.string());
    }

    std::string content;
    try {
        if (config_.format == tracker::LocalFormat::CSV) {
            content = encode_csv(session_id, records, metadata);
        } else {
            content = encode_batch(session_id, records, metadata).dump(2);
        }
    } catch (const nlohmann::json::exception& e) {
        return DeliveryResult::permanent(std::string("serialization failed: ") + e.what());
    }

    auto path = next_path(session_id);
    if (!core::paths::write_file_atomic(path, content)) {
        return DeliveryResult::transient("failed to write " + path.string());
    }

    spdlog::info("Saved {} records to {}", records.size(), path.string());
    enforce_record_cap();
    return DeliveryResult::delivered();
}

fs::path LocalSink::next_path(const std::string& session_id) {
    int64_t now_us = core::to_epoch_us(std::chrono::system_clock::now());
    last_stamp_us_ = std::max(now_us, last_stamp_us_ + 1);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%017lld", static_cast<long long>(last_stamp_us_));

    std::string ext = config_.format == tracker::LocalFormat::CSV ? ".csv" : ".json";
    return dir_ / (std::string(kFilePrefix) + stamp + "-" + session_id.substr(0, 8) + ext);
}

std::string LocalSink::encode_csv(const std::string& session_id,
                                  const std::vector<tracker::CallRecord>& records,
                                  const FlushMetadata& metadata) const {
    std::ostringstream out;
    out << "session_id,hostname,qualified_name,module,function,wall_time,cpu_time,timestamp_us,raised,arguments,return_value\n";
    for (const auto& r : records) {
        char wall[32];
        char cpu[32];
        std::snprintf(wall, sizeof(wall), "%.9f", r.wall_time);
        std::snprintf(cpu, sizeof(cpu), "%.9f", r.cpu_time);
        out << csv_escape(session_id) << ','
            << csv_escape(metadata.hostname) << ','
            << csv_escape(r.qualified_name) << ','
            << csv_escape(r.module) << ','
            << csv_escape(r.function) << ','
            << wall << ','
            << cpu << ','
            << core::to_epoch_us(r.timestamp) << ','
            << (r.raised ? "1" : "0") << ','
            << csv_escape(r.arguments.value_or("")) << ','
            << csv_escape(r.return_value.value_or("")) << '\n';
    }
    return out.str();
}

std::vector<fs::path> LocalSink::list_files() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.is_regular_file(ec) && is_flush_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.filename().string() < b.filename().string();
              });
    return files;
}

size_t LocalSink::total_records() const {
    size_t total = 0;
    for (const auto& file : list_files()) {
        total += count_records(file).value_or(0);
    }
    return total;
}

std::optional<size_t> LocalSink::count_records(const fs::path& file) {
    std::ifstream in(file);
    if (!in) return std::nullopt;

    if (file.extension() == ".csv") {
        size_t lines = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) ++lines;
        }
        return lines > 0 ? lines - 1 : 0;
    }

    try {
        auto j = nlohmann::json::parse(in);
        return j.value("record_count", size_t{0});
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable flush file {}: {}", file.string(), e.what());
        return std::nullopt;
    }
}

std::vector<tracker::CallRecord> LocalSink::read_records(const fs::path& file) {
    std::vector<tracker::CallRecord> records;
    std::ifstream in(file);
    if (!in) return records;

    if (file.extension() == ".csv") {
        std::string line;
        bool header = true;
        while (std::getline(in, line)) {
            if (header) { header = false; continue; }
            if (line.empty()) continue;
            auto f = csv_split(line);
            if (f.size() < 10) continue;
            try {
                tracker::CallRecord r;
                r.qualified_name = f[2];
                r.module = f[3];
                r.function = f[4];
                r.wall_time = std::stod(f[5]);
                r.cpu_time = std::stod(f[6]);
                r.timestamp = core::from_epoch_us(std::stoll(f[7]));
                r.raised = f[8] == "1";
                if (!f[9].empty()) r.arguments = f[9];
                if (f.size() > 10 && !f[10].empty()) r.return_value = f[10];
                records.push_back(std::move(r));
            } catch (const std::exception& e) {
                spdlog::warn("Skipping malformed row in {}: {}", file.string(), e.what());
            }
        }
        return records;
    }

    try {
        auto j = nlohmann::json::parse(in);
        for (const auto& item : j.value("records", nlohmann::json::array())) {
            records.push_back(tracker::CallRecord::from_json(item));
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable flush file {}: {}", file.string(), e.what());
    }
    return records;
}

void LocalSink::enforce_record_cap() {
    auto files = list_files();

    std::vector<size_t> counts;
    counts.reserve(files.size());
    size_t total = 0;
    for (const auto& file : files) {
        size_t n = count_records(file).value_or(0);
        counts.push_back(n);
        total += n;
    }

    // Oldest first; the last (newest) file is never a candidate
    for (size_t i = 0; i + 1 < files.size() && total > config_.max_records; ++i) {
        std::error_code ec;
        if (fs::remove(files[i], ec)) {
            total -= counts[i];
            spdlog::debug("Evicted {} ({} records)", files[i].string(), counts[i]);
        } else if (ec) {
            spdlog::warn("Failed to evict {}: {}", files[i].string(), ec.message());
        }
    }
}

} // namespace clockwork::storage
