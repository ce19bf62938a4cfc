#include "tracker/aggregation_store.hpp"
#include <algorithm>

namespace clockwork::tracker {

namespace {

void sort_by_time(std::vector<CallRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const CallRecord& a, const CallRecord& b) {
                         return a.timestamp < b.timestamp;
                     });
}

} // namespace

std::vector<CallRecord> StoreSnapshot::flatten() const {
    std::vector<CallRecord> out;
    out.reserve(total);
    for (const auto& [_, list] : records) {
        out.insert(out.end(), list.begin(), list.end());
    }
    sort_by_time(out);
    return out;
}

void AggregationStore::record(CallRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = records_[record.qualified_name];
    series.records.push_back(std::move(record));
    series.sequence.push_back(next_sequence_++);
    ++total_;
}

std::optional<FunctionSummary> AggregationStore::summary(const std::string& qualified_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(qualified_name);
    if (it == records_.end() || it->second.records.empty()) {
        return std::nullopt;
    }
    return summarize(qualified_name, it->second.records);
}

std::map<std::string, FunctionSummary> AggregationStore::summaries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, FunctionSummary> result;
    for (const auto& [name, series] : records_) {
        if (series.records.empty()) continue;
        result.emplace(name, summarize(name, series.records));
    }
    return result;
}

std::vector<CallRecord> AggregationStore::all_records() const {
    return snapshot().flatten();
}

std::vector<CallRecord> AggregationStore::all_records(const std::string& qualified_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(qualified_name);
    if (it == records_.end()) {
        return {};
    }
    return it->second.records;
}

StoreSnapshot AggregationStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreSnapshot snap;
    for (const auto& [name, series] : records_) {
        snap.records.emplace(name, series.records);
    }
    snap.total = total_;
    snap.high_water = next_sequence_ - 1;
    return snap;
}

void AggregationStore::clear_flushed(const StoreSnapshot& delivered) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
        auto& series = it->second;
        auto end = std::upper_bound(series.sequence.begin(), series.sequence.end(),
                                    delivered.high_water);
        auto n = end - series.sequence.begin();
        series.records.erase(series.records.begin(), series.records.begin() + n);
        series.sequence.erase(series.sequence.begin(), end);
        total_ -= static_cast<size_t>(n);
        if (series.records.empty()) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

void AggregationStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    total_ = 0;
}

size_t AggregationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

} // namespace clockwork::tracker
