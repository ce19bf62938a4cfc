#include "core/clock.hpp"
#include <cstdio>
#include <ctime>

namespace clockwork::core {

std::optional<double> process_cpu_seconds() {
    struct timespec ts;
    if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) != 0) {
        return std::nullopt;
    }
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

std::optional<ClockReading> read_clock() {
    auto cpu = process_cpu_seconds();
    if (!cpu) {
        return std::nullopt;
    }
    return ClockReading{std::chrono::steady_clock::now(), *cpu};
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t to_epoch_us(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::chrono::system_clock::time_point from_epoch_us(int64_t us) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(us)));
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    int64_t ms = to_epoch_ms(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    struct tm utc;
    gmtime_r(&secs, &utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms % 1000));
    return std::string(buf);
}

} // namespace clockwork::core
