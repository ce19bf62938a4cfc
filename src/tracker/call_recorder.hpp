#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/clock.hpp"
#include "tracker/aggregation_store.hpp"
#include "tracker/config.hpp"
#include "tracker/filter.hpp"

namespace clockwork::tracker {

class CallRecorder;

/**
 * Measures one invocation for as long as it is in scope.
 *
 * The record is taken in the destructor, so it is produced on every exit
 * path, including stack unwinding. Nothing thrown by measurement or
 * filtering leaves the destructor.
 */
class ScopedCall {
public:
    // qualified_name is split at its last '.' into module and function
    ScopedCall(CallRecorder& recorder, const std::string& qualified_name);
    ScopedCall(CallRecorder& recorder, std::string module, std::string function);
    ~ScopedCall();

    ScopedCall(const ScopedCall&) = delete;
    ScopedCall& operator=(const ScopedCall&) = delete;

    // True when this call is being measured
    bool active() const { return start_.has_value(); }

    void set_arguments(std::string arguments);
    void set_return_value(std::string value);

private:
    CallRecorder& recorder_;
    std::string module_;
    std::string function_;
    std::optional<core::ClockReading> start_;
    std::optional<std::string> arguments_;
    std::optional<std::string> return_value_;
    int uncaught_on_entry_;

    void begin();
};

/**
 * Turns measured invocations into call records.
 *
 * Applies the enablement flag, include/exclude filters, the minimum
 * execution time and the per-session call limit, then appends to the
 * aggregation store and notifies the upload path.
 */
class CallRecorder {
public:
    using RecordedCallback = std::function<void()>;
    using ClockFn = std::function<std::optional<core::ClockReading>()>;

    CallRecorder(const TrackerConfig& config, AggregationStore& store);

    CallRecorder(const CallRecorder&) = delete;
    CallRecorder& operator=(const CallRecorder&) = delete;

    // Invoked after every stored record (upload triggers hook in here)
    void set_on_recorded(RecordedCallback callback);

    // Test hook; set before any call is measured
    void set_clock(ClockFn clock);

    // Run fn(args...) as a measured call and return its result unchanged.
    template <typename Fn, typename... Args>
    std::invoke_result_t<Fn&&, Args&&...> instrument(const std::string& qualified_name, Fn&& fn, Args&&... args) {
        using Result = std::invoke_result_t<Fn&&, Args&&...>;
        ScopedCall scope(*this, qualified_name);
        if (scope.active() && track_arguments_) {
            scope.set_arguments(capture_arguments(args...));
        }
        if constexpr (!std::is_void_v<Result>) {
            if (scope.active() && track_return_values_) {
                Result result = std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
                scope.set_return_value(capture_return_value(result));
                return static_cast<Result&&>(result);
            }
        }
        return std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    }

    // Wrap fn into a callable that measures every invocation.
    template <typename Fn>
    auto wrap(std::string qualified_name, Fn fn) {
        return [this, name = std::move(qualified_name), fn = std::move(fn)](auto&&... args) -> decltype(auto) {
            return instrument(name, fn, std::forward<decltype(args)>(args)...);
        };
    }

    bool enabled() const { return enabled_; }
    bool should_track(const std::string& module, const std::string& function) const;
    size_t tracked_calls() const { return tracked_.load(std::memory_order_relaxed); }
    bool limit_reached() const { return tracked_calls() >= max_tracked_calls_; }

    // Serialize call arguments as a JSON array, truncated to the configured length.
    template <typename... Args>
    std::string capture_arguments(const Args&... args) const {
        try {
            nlohmann::json arr = nlohmann::json::array();
            (arr.push_back(argument_to_json(args)), ...);
            return truncate_arguments(arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        } catch (const std::exception& e) {
            spdlog::debug("Argument capture failed: {}", e.what());
            return "<unavailable>";
        }
    }

    // Serialize a return value, truncated like the arguments.
    template <typename T>
    std::string capture_return_value(const T& value) const {
        try {
            return truncate_arguments(argument_to_json(value).dump(-1, ' ', false,
                                                                   nlohmann::json::error_handler_t::replace));
        } catch (const std::exception& e) {
            spdlog::debug("Return value capture failed: {}", e.what());
            return "<unavailable>";
        }
    }

private:
    friend class ScopedCall;

    bool enabled_;
    double min_execution_time_;
    size_t max_tracked_calls_;
    bool track_arguments_;
    bool track_return_values_;
    size_t max_argument_length_;
    FilterRules filters_;
    AggregationStore& store_;
    RecordedCallback on_recorded_;
    ClockFn clock_;

    std::atomic<size_t> tracked_{0};
    std::atomic<bool> limit_logged_{false};

    // Called from ScopedCall's destructor
    void complete(const std::string& module, const std::string& function,
                  const core::ClockReading& start,
                  std::optional<std::string> arguments,
                  std::optional<std::string> return_value, bool raised) noexcept;

    std::optional<core::ClockReading> read_clock() const;

    bool claim_slot();
    std::string truncate_arguments(std::string text) const;

    template <typename T>
    static nlohmann::json argument_to_json(const T& value) {
        if constexpr (std::is_constructible_v<nlohmann::json, const T&>) {
            return nlohmann::json(value);
        } else {
            return "<opaque>";
        }
    }
};

} // namespace clockwork::tracker

// Measure the enclosing block as "<module>.<current function>".
#define CLOCKWORK_CONCAT_INNER(a, b) a##b
#define CLOCKWORK_CONCAT(a, b) CLOCKWORK_CONCAT_INNER(a, b)
#define CLOCKWORK_TRACK(recorder, module) \
    ::clockwork::tracker::ScopedCall CLOCKWORK_CONCAT(clockwork_scope_, __LINE__)((recorder), (module), __func__)
