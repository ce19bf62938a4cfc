#include "tracker/types.hpp"
#include "core/clock.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

namespace clockwork::tracker {

nlohmann::json CallRecord::to_json() const {
    nlohmann::json j{
        {"qualified_name", qualified_name},
        {"module", module},
        {"function", function},
        {"wall_time", wall_time},
        {"cpu_time", cpu_time},
        {"timestamp_us", core::to_epoch_us(timestamp)},
        {"raised", raised}
    };
    if (arguments) {
        j["arguments"] = *arguments;
    }
    if (return_value) {
        j["return_value"] = *return_value;
    }
    return j;
}

CallRecord CallRecord::from_json(const nlohmann::json& j) {
    CallRecord record;
    record.qualified_name = j.value("qualified_name", "");
    record.module = j.value("module", "");
    record.function = j.value("function", "");
    record.wall_time = j.value("wall_time", 0.0);
    record.cpu_time = j.value("cpu_time", 0.0);
    record.timestamp = core::from_epoch_us(j.value("timestamp_us", int64_t{0}));
    record.raised = j.value("raised", false);
    if (j.contains("arguments") && j["arguments"].is_string()) {
        record.arguments = j["arguments"].get<std::string>();
    }
    if (j.contains("return_value") && j["return_value"].is_string()) {
        record.return_value = j["return_value"].get<std::string>();
    }
    return record;
}

nlohmann::json TimeStats::to_json() const {
    return nlohmann::json{
        {"total", total},
        {"average", average},
        {"min", min},
        {"max", max}
    };
}

nlohmann::json FunctionSummary::to_json() const {
    return nlohmann::json{
        {"qualified_name", qualified_name},
        {"call_count", call_count},
        {"wall_time", wall_time.to_json()},
        {"cpu_time", cpu_time.to_json()}
    };
}

FunctionSummary summarize(const std::string& qualified_name,
                          const std::vector<CallRecord>& records) {
    FunctionSummary summary;
    summary.qualified_name = qualified_name;
    summary.call_count = records.size();
    if (records.empty()) {
        return summary;
    }

    summary.wall_time.min = records.front().wall_time;
    summary.wall_time.max = records.front().wall_time;
    summary.cpu_time.min = records.front().cpu_time;
    summary.cpu_time.max = records.front().cpu_time;

    for (const auto& record : records) {
        summary.wall_time.total += record.wall_time;
        summary.cpu_time.total += record.cpu_time;
        summary.wall_time.min = std::min(summary.wall_time.min, record.wall_time);
        summary.wall_time.max = std::max(summary.wall_time.max, record.wall_time);
        summary.cpu_time.min = std::min(summary.cpu_time.min, record.cpu_time);
        summary.cpu_time.max = std::max(summary.cpu_time.max, record.cpu_time);
    }

    const double n = static_cast<double>(records.size());
    summary.wall_time.average = summary.wall_time.total / n;
    summary.cpu_time.average = summary.cpu_time.total / n;
    return summary;
}

nlohmann::json SessionInfo::to_json() const {
    return nlohmann::json{
        {"session_id", session_id},
        {"hostname", hostname},
        {"start_time_ms", core::to_epoch_ms(start_time)}
    };
}

std::string generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    uint64_t hi = gen();
    uint64_t lo = gen();

    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi),
                  static_cast<unsigned long long>(lo));
    return std::string(buf);
}

} // namespace clockwork::tracker
