#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace clockwork::core {

// Point in time at which a measurement was taken.
struct ClockReading {
    std::chrono::steady_clock::time_point wall;
    double cpu_seconds;   // process CPU time (user + system)
};

// Process CPU time in seconds; nullopt if clock_gettime fails.
std::optional<double> process_cpu_seconds();

// Wall (monotonic) and CPU time read together; nullopt on failure.
std::optional<ClockReading> read_clock();

// Milliseconds / microseconds since the Unix epoch.
int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
int64_t to_epoch_us(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);
std::chrono::system_clock::time_point from_epoch_us(int64_t us);

// "2024-05-01T12:00:00.123Z"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Seconds as a floating point duration.
inline double seconds_between(std::chrono::steady_clock::time_point from,
                              std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace clockwork::core
