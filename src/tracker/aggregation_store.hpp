#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "tracker/types.hpp"

namespace clockwork::tracker {

// Copy of the store contents at one point in time, handed to a Sink.
struct StoreSnapshot {
    std::unordered_map<std::string, std::vector<CallRecord>> records;
    size_t total = 0;
    uint64_t high_water = 0;    // last sequence number the snapshot holds

    bool empty() const { return total == 0; }

    // All records ordered by completion time.
    std::vector<CallRecord> flatten() const;
};

// Process-local map from function identity to its call records.
// Append-only during a session; safe to share between threads.
class AggregationStore {
public:
    void record(CallRecord record);

    // Summary for one function; nullopt if it has no records.
    std::optional<FunctionSummary> summary(const std::string& qualified_name) const;

    // Summaries for every function, keyed by qualified name.
    std::map<std::string, FunctionSummary> summaries() const;

    std::vector<CallRecord> all_records() const;
    std::vector<CallRecord> all_records(const std::string& qualified_name) const;

    StoreSnapshot snapshot() const;

    // Remove the records a delivered snapshot contained. Records appended
    // after the snapshot was taken are kept, also across a clear().
    void clear_flushed(const StoreSnapshot& delivered);

    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    // Sequence numbers parallel to records, increasing within each list
    struct Series {
        std::vector<CallRecord> records;
        std::vector<uint64_t> sequence;
    };

    std::unordered_map<std::string, Series> records_;
    size_t total_ = 0;
    uint64_t next_sequence_ = 1;
    mutable std::mutex mutex_;
};

} // namespace clockwork::tracker
