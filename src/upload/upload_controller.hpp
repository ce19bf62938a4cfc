#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "storage/sink.hpp"
#include "tracker/aggregation_store.hpp"
#include "tracker/config.hpp"
#include "tracker/types.hpp"

namespace clockwork::upload {

struct FlushResult {
    bool attempted = false;             // false when there was nothing to flush or a flush was running
    storage::DeliveryStatus status = storage::DeliveryStatus::DELIVERED;
    size_t records = 0;
    uint32_t attempts = 0;
    bool fell_back = false;             // delivered to the local fallback instead
    std::string error;
};

/**
 * Decides when the aggregation store is flushed to a sink.
 *
 * Strategies:
 *   on_exit   - one flush from finish()
 *   real_time - flush after every record
 *   batch     - flush once batch_size records are held or batch_interval
 *               elapsed; checked on each record and on tick()
 *   manual    - only flush()
 *
 * Transient failures are retried with exponential backoff. When all
 * attempts fail the batch is written once to the fallback sink. Permanent
 * failures drop the batch. Records are removed from the store only after a
 * sink acknowledged them. Nothing here throws.
 */
class UploadController {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using NowFn = std::function<std::chrono::steady_clock::time_point()>;

    UploadController(tracker::UploadConfig config,
                     tracker::AggregationStore& store,
                     tracker::SessionInfo session,
                     storage::Sink& primary,
                     storage::Sink* fallback);

    UploadController(const UploadController&) = delete;
    UploadController& operator=(const UploadController&) = delete;

    // Test hooks
    void set_sleep_function(SleepFn sleep);
    void set_clock(NowFn now);

    // Called after every stored record
    void on_record();

    // Host-driven timer check (batch interval)
    void tick();

    // Explicit flush, honored under every strategy
    FlushResult flush();

    // Session release: flushes what the strategy owes at exit, once
    FlushResult finish();

    // Drop every held record without delivering; waits for a running flush
    size_t discard();

    tracker::UploadStrategy strategy() const { return config_.strategy; }
    uint64_t flush_count() const;

    // Delay before the next attempt after `failures` failed attempts
    static uint32_t backoff_delay_ms(const tracker::UploadConfig& config, uint32_t failures);

private:
    tracker::UploadConfig config_;
    tracker::AggregationStore& store_;
    tracker::SessionInfo session_;
    storage::Sink& primary_;
    storage::Sink* fallback_;
    SleepFn sleep_;
    NowFn now_;

    std::mutex flush_mutex_;
    std::chrono::steady_clock::time_point last_flush_;
    std::atomic<uint64_t> flush_count_{0};
    bool finished_ = false;

    // Callers hold flush_mutex_
    bool batch_due() const;
    FlushResult flush_locked();
    storage::DeliveryResult deliver_with_retry(const std::vector<tracker::CallRecord>& records,
                                               const storage::FlushMetadata& metadata,
                                               uint32_t& attempts);
    storage::DeliveryResult write_once(storage::Sink& sink,
                                       const std::vector<tracker::CallRecord>& records,
                                       const storage::FlushMetadata& metadata);
};

} // namespace clockwork::upload
