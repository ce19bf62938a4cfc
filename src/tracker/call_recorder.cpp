#include "tracker/call_recorder.hpp"
#include <spdlog/spdlog.h>

namespace clockwork::tracker {

namespace {

std::pair<std::string, std::string> split_qualified(const std::string& qualified_name) {
    auto dot = qualified_name.rfind('.');
    if (dot == std::string::npos) {
        return {std::string(), qualified_name};
    }
    return {qualified_name.substr(0, dot), qualified_name.substr(dot + 1)};
}

std::string join_qualified(const std::string& module, const std::string& function) {
    if (module.empty()) return function;
    return module + "." + function;
}

} // namespace

// ============================================================================
// ScopedCall
// ============================================================================

ScopedCall::ScopedCall(CallRecorder& recorder, const std::string& qualified_name)
    : recorder_(recorder)
    , uncaught_on_entry_(std::uncaught_exceptions()) {
    auto [module, function] = split_qualified(qualified_name);
    module_ = std::move(module);
    function_ = std::move(function);
    begin();
}

ScopedCall::ScopedCall(CallRecorder& recorder, std::string module, std::string function)
    : recorder_(recorder)
    , module_(std::move(module))
    , function_(std::move(function))
    , uncaught_on_entry_(std::uncaught_exceptions()) {
    begin();
}

void ScopedCall::begin() {
    if (!recorder_.enabled()) return;
    if (!recorder_.should_track(module_, function_)) return;

    start_ = recorder_.read_clock();
    if (!start_) {
        spdlog::warn("Clock read failed on entry to {}, call not measured",
                     join_qualified(module_, function_));
    }
}

ScopedCall::~ScopedCall() {
    if (!start_) return;
    bool raised = std::uncaught_exceptions() > uncaught_on_entry_;
    recorder_.complete(module_, function_, *start_, std::move(arguments_),
                       std::move(return_value_), raised);
}

void ScopedCall::set_arguments(std::string arguments) {
    arguments_ = std::move(arguments);
}

void ScopedCall::set_return_value(std::string value) {
    return_value_ = std::move(value);
}

// ============================================================================
// CallRecorder
// ============================================================================

CallRecorder::CallRecorder(const TrackerConfig& config, AggregationStore& store)
    : enabled_(config.enabled)
    , min_execution_time_(config.min_execution_time)
    , max_tracked_calls_(config.max_tracked_calls)
    , track_arguments_(config.filters.track_arguments)
    , track_return_values_(config.filters.track_return_values)
    , max_argument_length_(config.filters.max_argument_length)
    , filters_(config.filters)
    , store_(store)
    , clock_([] { return core::read_clock(); }) {}

void CallRecorder::set_on_recorded(RecordedCallback callback) {
    on_recorded_ = std::move(callback);
}

void CallRecorder::set_clock(ClockFn clock) {
    clock_ = std::move(clock);
}

std::optional<core::ClockReading> CallRecorder::read_clock() const {
    return clock_();
}

bool CallRecorder::should_track(const std::string& module, const std::string& function) const {
    try {
        return filters_.allows(module, function);
    } catch (const std::exception& e) {
        spdlog::warn("Filter evaluation failed for {}: {}", join_qualified(module, function), e.what());
        return false;
    }
}

void CallRecorder::complete(const std::string& module, const std::string& function,
                            const core::ClockReading& start,
                            std::optional<std::string> arguments,
                            std::optional<std::string> return_value, bool raised) noexcept {
    try {
        auto end = read_clock();
        if (!end) {
            spdlog::warn("Clock read failed on exit from {}, call not recorded",
                         join_qualified(module, function));
            return;
        }

        double wall = core::seconds_between(start.wall, end->wall);
        double cpu = end->cpu_seconds - start.cpu_seconds;
        if (wall < 0.0) wall = 0.0;
        if (cpu < 0.0) cpu = 0.0;

        if (wall < min_execution_time_) {
            return;
        }

        if (!claim_slot()) {
            if (!limit_logged_.exchange(true)) {
                spdlog::warn("max_tracked_calls ({}) reached, further calls are not stored",
                             max_tracked_calls_);
            }
            return;
        }

        CallRecord record;
        record.module = module;
        record.function = function;
        record.qualified_name = join_qualified(module, function);
        record.wall_time = wall;
        record.cpu_time = cpu;
        record.timestamp = std::chrono::system_clock::now();
        record.arguments = std::move(arguments);
        record.return_value = std::move(return_value);
        record.raised = raised;

        spdlog::trace("Recorded {} wall={:.6f}s cpu={:.6f}s", record.qualified_name, wall, cpu);
        store_.record(std::move(record));

        if (on_recorded_) {
            on_recorded_();
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to record call to {}: {}", join_qualified(module, function), e.what());
    }
}

bool CallRecorder::claim_slot() {
    size_t current = tracked_.load(std::memory_order_relaxed);
    while (current < max_tracked_calls_) {
        if (tracked_.compare_exchange_weak(current, current + 1, std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

std::string CallRecorder::truncate_arguments(std::string text) const {
    if (text.size() > max_argument_length_) {
        text.resize(max_argument_length_);
        text += "...";
    }
    return text;
}

} // namespace clockwork::tracker
