#include "storage/sink.hpp"
#include "core/clock.hpp"
#include <map>

namespace clockwork::storage {

const char* delivery_status_to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::DELIVERED:         return "DELIVERED";
        case DeliveryStatus::TRANSIENT_FAILURE: return "TRANSIENT_FAILURE";
        case DeliveryStatus::PERMANENT_FAILURE: return "PERMANENT_FAILURE";
        default: return "UNKNOWN";
    }
}

BatchTotals compute_totals(const std::vector<tracker::CallRecord>& records) {
    BatchTotals totals;
    totals.total_calls = records.size();
    for (const auto& record : records) {
        totals.total_wall_time += record.wall_time;
        totals.total_cpu_time += record.cpu_time;
    }
    return totals;
}

nlohmann::json encode_batch(const std::string& session_id,
                            const std::vector<tracker::CallRecord>& records,
                            const FlushMetadata& metadata) {
    std::map<std::string, std::vector<tracker::CallRecord>> by_function;
    nlohmann::json record_list = nlohmann::json::array();
    for (const auto& record : records) {
        by_function[record.qualified_name].push_back(record);
        record_list.push_back(record.to_json());
    }

    nlohmann::json summaries = nlohmann::json::object();
    for (const auto& [name, list] : by_function) {
        summaries[name] = tracker::summarize(name, list).to_json();
    }

    auto totals = compute_totals(records);
    return nlohmann::json{
        {"session_id", session_id},
        {"hostname", metadata.hostname},
        {"session_start_ms", core::to_epoch_ms(metadata.session_start)},
        {"flushed_at_ms", core::to_epoch_ms(metadata.flushed_at)},
        {"strategy", metadata.strategy},
        {"record_count", totals.total_calls},
        {"total_wall_time", totals.total_wall_time},
        {"total_cpu_time", totals.total_cpu_time},
        {"summaries", summaries},
        {"records", record_list}
    };
}

} // namespace clockwork::storage
