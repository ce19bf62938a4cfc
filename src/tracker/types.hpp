#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace clockwork::tracker {

// One measured invocation. Immutable once recorded.
struct CallRecord {
    std::string qualified_name;             // "module.function"
    std::string module;
    std::string function;
    double wall_time = 0.0;                 // seconds
    double cpu_time = 0.0;                  // seconds
    std::chrono::system_clock::time_point timestamp;   // call completion
    std::optional<std::string> arguments;   // only with argument tracking
    std::optional<std::string> return_value;    // only with return value tracking
    bool raised = false;                    // exited through an exception

    nlohmann::json to_json() const;
    static CallRecord from_json(const nlohmann::json& j);
};

struct TimeStats {
    double total = 0.0;
    double average = 0.0;
    double min = 0.0;
    double max = 0.0;

    nlohmann::json to_json() const;
};

// Aggregate statistics for one function; derived on demand, never stored.
struct FunctionSummary {
    std::string qualified_name;
    size_t call_count = 0;
    TimeStats wall_time;
    TimeStats cpu_time;

    nlohmann::json to_json() const;
};

// Compute a summary from the records of a single function.
FunctionSummary summarize(const std::string& qualified_name,
                          const std::vector<CallRecord>& records);

// Identity of one process lifetime of instrumentation.
struct SessionInfo {
    std::string session_id;
    std::string hostname;
    std::chrono::system_clock::time_point start_time;

    nlohmann::json to_json() const;
};

// Random 128-bit identifier as 32 lowercase hex characters.
std::string generate_session_id();

} // namespace clockwork::tracker
