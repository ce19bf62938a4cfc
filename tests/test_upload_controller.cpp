// ============================================================================
// clockwork - UploadController tests
// ============================================================================
#include "upload/upload_controller.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cstdio>
#include <deque>
#include <stdexcept>

using namespace clockwork;
using storage::DeliveryResult;
using storage::DeliveryStatus;

// Sink answering from a script; unscripted writes are delivered.
class ScriptedSink : public storage::Sink {
public:
    explicit ScriptedSink(const char* label) : label_(label) {}

    std::deque<DeliveryResult> script;
    int writes = 0;
    std::vector<size_t> delivered_sizes;

    DeliveryResult write(const std::string&, const std::vector<tracker::CallRecord>& records,
                         const storage::FlushMetadata&) override {
        ++writes;
        DeliveryResult r;
        if (!script.empty()) {
            r = script.front();
            script.pop_front();
        }
        if (r.ok()) delivered_sizes.push_back(records.size());
        return r;
    }

    const char* name() const override { return label_; }

private:
    const char* label_;
};

static tracker::SessionInfo make_session() {
    tracker::SessionInfo info;
    info.session_id = "feedfacefeedfacefeedfacefeedface";
    info.hostname = "host";
    info.start_time = std::chrono::system_clock::now();
    return info;
}

static void add_records(tracker::AggregationStore& store, int n) {
    for (int i = 0; i < n; ++i) {
        tracker::CallRecord r;
        r.qualified_name = "job.step";
        r.module = "job";
        r.function = "step";
        r.wall_time = 0.02;
        r.timestamp = std::chrono::system_clock::now();
        store.record(r);
    }
}

static tracker::UploadConfig make_config(tracker::UploadStrategy strategy) {
    tracker::UploadConfig config;
    config.strategy = strategy;
    config.retry_attempts = 3;
    config.backoff_initial_ms = 100;
    config.backoff_max_ms = 250;
    config.backoff_multiplier = 2.0;
    return config;
}

// -- backoff curve ---------------------------------------------------------------

static void test_backoff_delay() {
    std::printf("test_backoff_delay ... ");

    auto config = make_config(tracker::UploadStrategy::MANUAL);
    assert(upload::UploadController::backoff_delay_ms(config, 1) == 100);
    assert(upload::UploadController::backoff_delay_ms(config, 2) == 200);
    assert(upload::UploadController::backoff_delay_ms(config, 3) == 250);
    assert(upload::UploadController::backoff_delay_ms(config, 30) == 250);

    std::printf("PASS\n");
}

// -- records survive until acknowledged ------------------------------------------

static void test_transient_then_success() {
    std::printf("test_transient_then_success ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    ScriptedSink fallback("fallback");
    primary.script.push_back(DeliveryResult::transient("timeout"));

    upload::UploadController controller(make_config(tracker::UploadStrategy::MANUAL),
                                        store, make_session(), primary, &fallback);
    std::vector<std::chrono::milliseconds> sleeps;
    controller.set_sleep_function([&](std::chrono::milliseconds d) {
        // Still held while the retry is pending
        assert(store.size() == 5);
        sleeps.push_back(d);
    });

    add_records(store, 5);
    auto result = controller.flush();

    assert(result.attempted);
    assert(result.status == DeliveryStatus::DELIVERED);
    assert(result.attempts == 2);
    assert(!result.fell_back);
    assert(sleeps.size() == 1 && sleeps[0].count() == 100);
    assert(primary.delivered_sizes.size() == 1 && primary.delivered_sizes[0] == 5);
    assert(fallback.writes == 0);
    assert(store.empty());

    std::printf("PASS\n");
}

// -- exhausted retries ----------------------------------------------------------------

static void test_exhausted_retries_use_fallback_once() {
    std::printf("test_exhausted_retries_use_fallback_once ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    ScriptedSink fallback("fallback");
    for (int i = 0; i < 3; ++i) {
        primary.script.push_back(DeliveryResult::transient("unreachable"));
    }

    upload::UploadController controller(make_config(tracker::UploadStrategy::MANUAL),
                                        store, make_session(), primary, &fallback);
    int sleeps = 0;
    controller.set_sleep_function([&sleeps](std::chrono::milliseconds) { ++sleeps; });

    add_records(store, 4);
    auto result = controller.flush();

    assert(result.attempts == 3);
    assert(result.status == DeliveryStatus::TRANSIENT_FAILURE);
    assert(result.fell_back);
    assert(sleeps == 2);
    assert(primary.writes == 3);
    assert(fallback.writes == 1);
    assert(fallback.delivered_sizes[0] == 4);
    assert(store.empty());

    std::printf("PASS\n");
}

static void test_fallback_failure_keeps_records() {
    std::printf("test_fallback_failure_keeps_records ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    ScriptedSink fallback("fallback");
    auto config = make_config(tracker::UploadStrategy::MANUAL);
    config.retry_attempts = 1;
    primary.script.push_back(DeliveryResult::transient("down"));
    fallback.script.push_back(DeliveryResult::transient("disk full"));

    upload::UploadController controller(config, store, make_session(), primary, &fallback);
    add_records(store, 2);
    auto result = controller.flush();
    assert(!result.fell_back);
    assert(store.size() == 2);

    // Next flush picks them up
    auto retry = controller.flush();
    assert(retry.status == DeliveryStatus::DELIVERED);
    assert(store.empty());

    std::printf("PASS\n");
}

// -- permanent failures -----------------------------------------------------------------

static void test_permanent_failure_drops_batch() {
    std::printf("test_permanent_failure_drops_batch ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    ScriptedSink fallback("fallback");
    primary.script.push_back(DeliveryResult::permanent("access denied"));

    upload::UploadController controller(make_config(tracker::UploadStrategy::MANUAL),
                                        store, make_session(), primary, &fallback);
    add_records(store, 3);
    auto result = controller.flush();

    assert(result.status == DeliveryStatus::PERMANENT_FAILURE);
    assert(result.attempts == 1);
    assert(primary.writes == 1);
    assert(fallback.writes == 0);
    assert(store.empty());

    std::printf("PASS\n");
}

// -- strategies ------------------------------------------------------------------------

static void test_real_time_strategy() {
    std::printf("test_real_time_strategy ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    upload::UploadController controller(make_config(tracker::UploadStrategy::REAL_TIME),
                                        store, make_session(), primary, nullptr);

    for (int i = 0; i < 3; ++i) {
        add_records(store, 1);
        controller.on_record();
    }
    assert(primary.writes == 3);
    assert(store.empty());
    assert(controller.flush_count() == 3);

    std::printf("PASS\n");
}

static void test_batch_size_and_interval() {
    std::printf("test_batch_size_and_interval ... ");

    tracker::AggregationStore store;
    ScriptedSink primary("primary");
    auto config = make_config(tracker::UploadStrategy::BATCH);
    config.batch_size = 3;
    config.batch_interval_secs = 10.0;

    upload::UploadController controller(config, store, make_session(), primary, nullptr);
    auto now = std::chrono::steady_clock::time_point(std::chrono::seconds(1000));
    controller.set_clock([&now] { return now; });

    for (int i = 0; i < 2; ++i) {
        add_records(store, 1);
        controller.on_record();
    }
    assert(primary.writes == 0);

    add_records(store, 1);
    controller.on_record();
    assert(primary.writes == 1);
    assert(primary.delivered_sizes[0] == 3);

    // One record, then the interval elapses
    add_records(store, 1);
    controller.on_record();
    controller.tick();
    assert(primary.writes == 1);

    now += std::chrono::seconds(11);
    controller.tick();
    assert(primary.writes == 2);
    assert(primary.delivered_sizes[1] == 1);

    // Nothing held: an elapsed interval does not flush
    now += std::chrono::seconds(11);
    controller.tick();
    assert(primary.writes == 2);

    // Remainder is flushed at release
    add_records(store, 2);
    auto final_flush = controller.finish();
    assert(final_flush.attempted);
    assert(primary.writes == 3);
    assert(store.empty());

    std::printf("PASS\n");
}

static void test_on_exit_and_manual() {
    std::printf("test_on_exit_and_manual ... ");

    {
        tracker::AggregationStore store;
        ScriptedSink primary("primary");
        upload::UploadController controller(make_config(tracker::UploadStrategy::ON_EXIT),
                                            store, make_session(), primary, nullptr);
        add_records(store, 4);
        controller.on_record();
        controller.tick();
        assert(primary.writes == 0);

        controller.finish();
        assert(primary.writes == 1);
        // Exactly once
        add_records(store, 1);
        controller.finish();
        assert(primary.writes == 1);
    }
    {
        tracker::AggregationStore store;
        ScriptedSink primary("primary");
        upload::UploadController controller(make_config(tracker::UploadStrategy::MANUAL),
                                            store, make_session(), primary, nullptr);
        add_records(store, 2);
        controller.on_record();
        auto result = controller.finish();
        assert(!result.attempted);
        assert(primary.writes == 0);
        assert(store.size() == 2);

        controller.flush();
        assert(primary.writes == 1);
    }

    std::printf("PASS\n");
}

// -- sink exceptions ---------------------------------------------------------------------

class ThrowingSink : public storage::Sink {
public:
    DeliveryResult write(const std::string&, const std::vector<tracker::CallRecord>&,
                         const storage::FlushMetadata&) override {
        throw std::runtime_error("socket closed");
    }
    const char* name() const override { return "throwing"; }
};

static void test_sink_exception_is_transient() {
    std::printf("test_sink_exception_is_transient ... ");

    tracker::AggregationStore store;
    ThrowingSink primary;
    ScriptedSink fallback("fallback");
    auto config = make_config(tracker::UploadStrategy::MANUAL);
    config.retry_attempts = 2;

    upload::UploadController controller(config, store, make_session(), primary, &fallback);
    controller.set_sleep_function([](std::chrono::milliseconds) {});
    add_records(store, 1);

    auto result = controller.flush();
    assert(result.attempts == 2);
    assert(result.fell_back);
    assert(fallback.writes == 1);

    std::printf("PASS\n");
}

// -- records appended during a flush survive a clear ---------------------------

class ClearingSink : public storage::Sink {
public:
    explicit ClearingSink(tracker::AggregationStore& store) : store_(store) {}

    DeliveryResult write(const std::string&, const std::vector<tracker::CallRecord>&,
                         const storage::FlushMetadata&) override {
        store_.clear();
        add_records(store_, 2);
        return DeliveryResult::delivered();
    }

    const char* name() const override { return "clearing"; }

private:
    tracker::AggregationStore& store_;
};

static void test_records_added_during_flush_kept() {
    std::printf("test_records_added_during_flush_kept ... ");

    tracker::AggregationStore store;
    ClearingSink primary(store);
    upload::UploadController controller(make_config(tracker::UploadStrategy::MANUAL),
                                        store, make_session(), primary, nullptr);

    add_records(store, 5);
    auto result = controller.flush();
    assert(result.status == DeliveryStatus::DELIVERED);
    assert(result.records == 5);
    assert(store.size() == 2);

    assert(controller.discard() == 2);
    assert(store.empty());

    std::printf("PASS\n");
}

int main() {
    clockwork::testing::quiet_logs();
    std::printf("=== clockwork - UploadController ===\n\n");

    test_backoff_delay();
    test_transient_then_success();
    test_exhausted_retries_use_fallback_once();
    test_fallback_failure_keeps_records();
    test_permanent_failure_drops_batch();
    test_real_time_strategy();
    test_batch_size_and_interval();
    test_on_exit_and_manual();
    test_sink_exception_is_transient();
    test_records_added_during_flush_kept();

    std::printf("\nAll 10 tests passed.\n");
    return 0;
}
