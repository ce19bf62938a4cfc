#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tracker/types.hpp"

namespace clockwork::storage {

enum class DeliveryStatus {
    DELIVERED,
    TRANSIENT_FAILURE,   // timeout, throttling, temporary I/O or network failure
    PERMANENT_FAILURE    // schema, permission or configuration failure
};

const char* delivery_status_to_string(DeliveryStatus status);

struct DeliveryResult {
    DeliveryStatus status = DeliveryStatus::DELIVERED;
    std::string error;

    bool ok() const { return status == DeliveryStatus::DELIVERED; }

    static DeliveryResult delivered() { return {}; }
    static DeliveryResult transient(std::string message) {
        return {DeliveryStatus::TRANSIENT_FAILURE, std::move(message)};
    }
    static DeliveryResult permanent(std::string message) {
        return {DeliveryStatus::PERMANENT_FAILURE, std::move(message)};
    }
};

// Context of one flush, stored next to the records.
struct FlushMetadata {
    std::string hostname;
    std::chrono::system_clock::time_point session_start;
    std::chrono::system_clock::time_point flushed_at;
    std::string strategy;
};

struct BatchTotals {
    size_t total_calls = 0;
    double total_wall_time = 0.0;
    double total_cpu_time = 0.0;
};

BatchTotals compute_totals(const std::vector<tracker::CallRecord>& records);

// Serialized form of one flush: metadata, per-function summaries, records.
nlohmann::json encode_batch(const std::string& session_id,
                            const std::vector<tracker::CallRecord>& records,
                            const FlushMetadata& metadata);

// Persistence or upload destination for flushed call records.
class Sink {
public:
    virtual ~Sink() = default;

    virtual DeliveryResult write(const std::string& session_id,
                                 const std::vector<tracker::CallRecord>& records,
                                 const FlushMetadata& metadata) = 0;

    virtual const char* name() const = 0;
};

} // namespace clockwork::storage
