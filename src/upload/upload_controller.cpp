#include "upload/upload_controller.hpp"
#include <thread>
#include <spdlog/spdlog.h>

namespace clockwork::upload {

using storage::DeliveryResult;
using storage::DeliveryStatus;
using tracker::UploadStrategy;

UploadController::UploadController(tracker::UploadConfig config,
                                   tracker::AggregationStore& store,
                                   tracker::SessionInfo session,
                                   storage::Sink& primary,
                                   storage::Sink* fallback)
    : config_(std::move(config))
    , store_(store)
    , session_(std::move(session))
    , primary_(primary)
    , fallback_(fallback == &primary ? nullptr : fallback)
    , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    , now_([] { return std::chrono::steady_clock::now(); }) {
    last_flush_ = now_();
    spdlog::debug("Upload strategy {} via {} sink", tracker::upload_strategy_to_string(config_.strategy),
                  primary_.name());
}

void UploadController::set_sleep_function(SleepFn sleep) {
    sleep_ = std::move(sleep);
}

void UploadController::set_clock(NowFn now) {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    now_ = std::move(now);
    last_flush_ = now_();
}

uint64_t UploadController::flush_count() const {
    return flush_count_.load(std::memory_order_relaxed);
}

uint32_t UploadController::backoff_delay_ms(const tracker::UploadConfig& config, uint32_t failures) {
    // initial * multiplier^(failures - 1), capped
    double delay = config.backoff_initial_ms;
    for (uint32_t i = 1; i < failures; ++i) {
        delay *= config.backoff_multiplier;
        if (delay >= config.backoff_max_ms) {
            return config.backoff_max_ms;
        }
    }
    if (delay >= config.backoff_max_ms) {
        return config.backoff_max_ms;
    }
    return static_cast<uint32_t>(delay);
}

bool UploadController::batch_due() const {
    size_t held = store_.size();
    if (held == 0) return false;
    if (held >= config_.batch_size) return true;
    auto interval = std::chrono::duration<double>(config_.batch_interval_secs);
    return now_() - last_flush_ >= interval;
}

void UploadController::on_record() {
    if (config_.strategy != UploadStrategy::REAL_TIME && config_.strategy != UploadStrategy::BATCH) {
        return;
    }

    // Another thread is flushing; its successor trigger picks these records up
    std::unique_lock<std::mutex> lock(flush_mutex_, std::try_to_lock);
    if (!lock.owns_lock() || finished_) {
        return;
    }
    if (config_.strategy == UploadStrategy::BATCH && !batch_due()) {
        return;
    }
    flush_locked();
}

void UploadController::tick() {
    if (config_.strategy != UploadStrategy::BATCH) {
        return;
    }
    std::unique_lock<std::mutex> lock(flush_mutex_, std::try_to_lock);
    if (!lock.owns_lock() || finished_) {
        return;
    }
    if (batch_due()) {
        flush_locked();
    }
}

FlushResult UploadController::flush() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    return flush_locked();
}

FlushResult UploadController::finish() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    if (finished_) {
        return {};
    }
    finished_ = true;

    if (config_.strategy == UploadStrategy::MANUAL) {
        size_t left = store_.size();
        if (left > 0) {
            spdlog::info("{} records left unflushed (manual upload strategy)", left);
        }
        return {};
    }
    return flush_locked();
}

size_t UploadController::discard() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    size_t dropped = store_.size();
    store_.clear();
    if (dropped > 0) {
        spdlog::info("Discarded {} unflushed records", dropped);
    }
    return dropped;
}

FlushResult UploadController::flush_locked() {
    FlushResult result;

    auto snapshot = store_.snapshot();
    if (snapshot.empty()) {
        return result;
    }

    auto records = snapshot.flatten();
    result.attempted = true;
    result.records = records.size();

    storage::FlushMetadata metadata;
    metadata.hostname = session_.hostname;
    metadata.session_start = session_.start_time;
    metadata.flushed_at = std::chrono::system_clock::now();
    metadata.strategy = tracker::upload_strategy_to_string(config_.strategy);

    auto delivery = deliver_with_retry(records, metadata, result.attempts);
    result.status = delivery.status;
    result.error = delivery.error;
    last_flush_ = now_();
    flush_count_.fetch_add(1, std::memory_order_relaxed);

    switch (delivery.status) {
        case DeliveryStatus::DELIVERED:
            store_.clear_flushed(snapshot);
            break;

        case DeliveryStatus::PERMANENT_FAILURE:
            spdlog::error("Upload to {} failed permanently, dropping {} records: {}",
                          primary_.name(), records.size(), delivery.error);
            store_.clear_flushed(snapshot);
            break;

        case DeliveryStatus::TRANSIENT_FAILURE:
        default: {
            spdlog::error("Upload to {} failed after {} attempts: {}",
                          primary_.name(), result.attempts, delivery.error);
            if (fallback_ == nullptr) {
                spdlog::warn("No fallback sink, keeping {} records for the next flush", records.size());
                break;
            }
            auto fb = write_once(*fallback_, records, metadata);
            if (fb.ok()) {
                spdlog::warn("Saved {} records to {} fallback", records.size(), fallback_->name());
                store_.clear_flushed(snapshot);
                result.fell_back = true;
            } else {
                spdlog::error("Fallback to {} failed, keeping {} records in memory: {}",
                              fallback_->name(), records.size(), fb.error);
            }
            break;
        }
    }
    return result;
}

DeliveryResult UploadController::deliver_with_retry(const std::vector<tracker::CallRecord>& records,
                                                    const storage::FlushMetadata& metadata,
                                                    uint32_t& attempts) {
    const uint32_t max_attempts = config_.retry_attempts == 0 ? 1 : config_.retry_attempts;
    DeliveryResult last;

    for (attempts = 1; attempts <= max_attempts; ++attempts) {
        last = write_once(primary_, records, metadata);
        if (last.status != DeliveryStatus::TRANSIENT_FAILURE) {
            return last;
        }
        if (attempts == max_attempts) {
            break;
        }
        uint32_t delay = backoff_delay_ms(config_, attempts);
        spdlog::warn("Upload attempt {}/{} to {} failed ({}), retrying in {}ms",
                     attempts, max_attempts, primary_.name(), last.error, delay);
        sleep_(std::chrono::milliseconds(delay));
    }
    return last;
}

DeliveryResult UploadController::write_once(storage::Sink& sink,
                                            const std::vector<tracker::CallRecord>& records,
                                            const storage::FlushMetadata& metadata) {
    try {
        return sink.write(session_.session_id, records, metadata);
    } catch (const std::exception& e) {
        return DeliveryResult::transient(std::string(sink.name()) + " sink threw: " + e.what());
    }
}

} // namespace clockwork::upload
