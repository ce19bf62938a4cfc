#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "correlate/correlator.hpp"
#include "storage/sink.hpp"
#include "tracker/aggregation_store.hpp"
#include "tracker/call_recorder.hpp"
#include "tracker/config.hpp"
#include "tracker/types.hpp"
#include "upload/upload_controller.hpp"

namespace clockwork {

/**
 * One process lifetime of instrumentation.
 *
 * Owns the aggregation store, the recorder, the sinks and the upload
 * controller. release() (or the destructor) performs the exit flush the
 * upload strategy calls for; it runs once.
 */
class Session {
public:
    explicit Session(tracker::TrackerConfig config);

    // Explicit sinks; fallback may be null
    Session(tracker::TrackerConfig config,
            std::unique_ptr<storage::Sink> primary,
            std::unique_ptr<storage::Sink> fallback);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    template <typename Fn, typename... Args>
    decltype(auto) instrument(const std::string& qualified_name, Fn&& fn, Args&&... args) {
        return recorder_.instrument(qualified_name, std::forward<Fn>(fn), std::forward<Args>(args)...);
    }

    template <typename Fn>
    auto wrap(std::string qualified_name, Fn fn) {
        return recorder_.wrap(std::move(qualified_name), std::move(fn));
    }

    tracker::CallRecorder& recorder() { return recorder_; }
    tracker::AggregationStore& store() { return store_; }
    upload::UploadController& uploads() { return *uploads_; }

    std::optional<tracker::FunctionSummary> summary(const std::string& qualified_name) const;
    std::map<std::string, tracker::FunctionSummary> summaries() const;

    // Summaries plus every record still held, as JSON
    nlohmann::json results() const;
    void clear_results();

    upload::FlushResult flush();
    void tick();

    // Join held records with sampler data; default window is session start to now
    correlate::CorrelationReport correlate() const;
    correlate::CorrelationReport correlate(std::chrono::system_clock::time_point start,
                                           std::chrono::system_clock::time_point end) const;

    // Human-readable table of the current summaries
    std::string render_summary() const;

    // Exit flush; idempotent
    void release();
    bool released() const { return released_; }

    const tracker::SessionInfo& info() const { return info_; }
    const tracker::TrackerConfig& config() const { return config_; }

private:
    tracker::TrackerConfig config_;
    tracker::SessionInfo info_;
    tracker::AggregationStore store_;
    std::unique_ptr<storage::Sink> primary_;
    std::unique_ptr<storage::Sink> fallback_;
    std::unique_ptr<upload::UploadController> uploads_;
    tracker::CallRecorder recorder_;
    bool released_ = false;

    void wire();
};

} // namespace clockwork
