// ============================================================================
// clockwork - CallRecorder tests
// ============================================================================
#include "tracker/call_recorder.hpp"
#include "test_util.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace clockwork::tracker;

static void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static TrackerConfig base_config() {
    TrackerConfig config;
    config.min_execution_time = 0.0;
    return config;
}

// -- return values and wall time ----------------------------------------------

static void test_instrument_returns_value() {
    std::printf("test_instrument_returns_value ... ");

    auto config = base_config();
    AggregationStore store;
    CallRecorder recorder(config, store);

    int result = recorder.instrument("math.add", [](int a, int b) { return a + b; }, 2, 3);
    assert(result == 5);

    std::string s = recorder.instrument("text.upper", [] { return std::string("ABC"); });
    assert(s == "ABC");

    // References pass through untouched
    int value = 1;
    int& ref = recorder.instrument("mem.ref", [&value]() -> int& { return value; });
    ref = 7;
    assert(value == 7);

    auto slow = recorder.wrap("io.wait", [](int ms) { sleep_ms(ms); return ms; });
    assert(slow(20) == 20);

    auto summary = store.summary("io.wait");
    assert(summary.has_value());
    assert(summary->call_count == 1);
    assert(summary->wall_time.total >= 0.02);
    assert(summary->cpu_time.total >= 0.0);
    assert(store.size() == 4);

    auto records = store.all_records("math.add");
    assert(records.size() == 1);
    assert(records[0].module == "math");
    assert(records[0].function == "add");
    assert(!records[0].arguments.has_value());

    std::printf("PASS\n");
}

// -- minimum execution time -----------------------------------------------------

static void test_min_execution_time() {
    std::printf("test_min_execution_time ... ");

    auto config = base_config();
    config.min_execution_time = 0.01;
    AggregationStore store;
    CallRecorder recorder(config, store);

    recorder.instrument("app.fast", [] { return 0; });
    recorder.instrument("app.slow", [] { sleep_ms(20); });

    assert(!store.summary("app.fast").has_value());
    assert(store.summary("app.slow").has_value());
    assert(store.summary("app.slow")->wall_time.min >= 0.01);

    // A zero threshold keeps even instantaneous calls
    auto zero = base_config();
    AggregationStore store_zero;
    CallRecorder recorder_zero(zero, store_zero);
    recorder_zero.instrument("app.fast", [] { return 0; });
    assert(store_zero.size() == 1);

    std::printf("PASS\n");
}

// -- exact threshold boundary --------------------------------------------------

// Readings advance by a scripted wall duration per call (start, then end)
class SteppedClock {
public:
    explicit SteppedClock(std::vector<std::chrono::nanoseconds> durations)
        : durations_(std::move(durations)) {}

    std::optional<clockwork::core::ClockReading> operator()() {
        clockwork::core::ClockReading reading{now_, 0.0};
        if (!at_end_) {
            at_end_ = true;
        } else {
            at_end_ = false;
            reading.wall = now_ + durations_.at(next_++);
            now_ = reading.wall + std::chrono::seconds(1);
        }
        return reading;
    }

private:
    std::vector<std::chrono::nanoseconds> durations_;
    std::chrono::steady_clock::time_point now_{std::chrono::seconds(1000)};
    size_t next_ = 0;
    bool at_end_ = false;
};

static void test_min_execution_time_boundary() {
    std::printf("test_min_execution_time_boundary ... ");

    auto config = base_config();
    config.min_execution_time = 0.01;
    AggregationStore store;
    CallRecorder recorder(config, store);

    auto clock = std::make_shared<SteppedClock>(std::vector<std::chrono::nanoseconds>{
        std::chrono::milliseconds(10),
        std::chrono::nanoseconds(9999999),
        std::chrono::milliseconds(25),
    });
    recorder.set_clock([clock] { return (*clock)(); });

    recorder.instrument("edge.equal", [] {});
    recorder.instrument("edge.below", [] {});
    recorder.instrument("edge.above", [] {});

    auto equal = store.all_records("edge.equal");
    assert(equal.size() == 1);
    assert(equal[0].wall_time == 0.01);
    assert(store.all_records("edge.below").empty());
    assert(store.all_records("edge.above").size() == 1);
    assert(store.size() == 2);

    std::printf("PASS\n");
}

// -- exceptions pass through ----------------------------------------------------

static void test_exception_propagates() {
    std::printf("test_exception_propagates ... ");

    auto config = base_config();
    AggregationStore store;
    CallRecorder recorder(config, store);

    bool caught = false;
    try {
        recorder.instrument("app.divide", [](int a, int b) {
            if (b == 0) throw std::domain_error("division by zero");
            return a / b;
        }, 1, 0);
    } catch (const std::domain_error& e) {
        caught = std::string(e.what()) == "division by zero";
    }
    assert(caught);

    auto records = store.all_records("app.divide");
    assert(records.size() == 1);
    assert(records[0].raised);

    recorder.instrument("app.divide", [](int a, int b) { return a / b; }, 4, 2);
    records = store.all_records("app.divide");
    assert(records.size() == 2);
    assert(!records[1].raised);

    std::printf("PASS\n");
}

// -- max_tracked_calls ------------------------------------------------------------

static void test_call_limit() {
    std::printf("test_call_limit ... ");

    auto config = base_config();
    config.max_tracked_calls = 3;
    AggregationStore store;
    CallRecorder recorder(config, store);

    int ran = 0;
    for (int i = 0; i < 5; ++i) {
        recorder.instrument("app.loop", [&ran] { ++ran; });
    }
    assert(ran == 5);
    assert(store.size() == 3);
    assert(recorder.tracked_calls() == 3);
    assert(recorder.limit_reached());

    std::printf("PASS\n");
}

// -- include/exclude filters ------------------------------------------------------

static void test_filters() {
    std::printf("test_filters ... ");

    auto config = base_config();
    config.filters.exclude_functions = {"^_.*", "^test_.*"};
    config.filters.exclude_modules = {"vendor"};
    AggregationStore store;
    CallRecorder recorder(config, store);

    recorder.instrument("app._private", [] {});
    recorder.instrument("app.test_helper", [] {});
    recorder.instrument("vendor.parse", [] {});
    recorder.instrument("vendor_ext.parse", [] {});
    recorder.instrument("app.public", [] {});

    assert(store.size() == 2);
    assert(store.summary("app.public").has_value());
    assert(store.summary("vendor_ext.parse").has_value());

    auto allow = base_config();
    allow.filters.include_modules = {"core\\..*"};
    AggregationStore allow_store;
    CallRecorder allow_recorder(allow, allow_store);
    allow_recorder.instrument("core.net.send", [] {});
    allow_recorder.instrument("ui.draw", [] {});
    assert(allow_store.size() == 1);
    assert(allow_store.summary("core.net.send").has_value());

    // An invalid regex still matches its exact text
    auto bad = base_config();
    bad.filters.exclude_functions = {"run("};
    AggregationStore bad_store;
    CallRecorder bad_recorder(bad, bad_store);
    bad_recorder.instrument("app.run(", [] {});
    bad_recorder.instrument("app.run", [] {});
    assert(bad_store.size() == 1);

    std::printf("PASS\n");
}

// -- disabled engine -----------------------------------------------------------------

static void test_disabled() {
    std::printf("test_disabled ... ");

    auto config = base_config();
    config.enabled = false;
    AggregationStore store;
    CallRecorder recorder(config, store);

    int calls = 0;
    recorder.set_on_recorded([&calls] { ++calls; });
    int v = recorder.instrument("app.work", [] { return 42; });
    assert(v == 42);
    assert(store.empty());
    assert(calls == 0);

    std::printf("PASS\n");
}

// -- argument capture -------------------------------------------------------------------

struct Opaque {
    int x;
};

static void test_argument_capture() {
    std::printf("test_argument_capture ... ");

    auto config = base_config();
    config.filters.track_arguments = true;
    config.filters.max_argument_length = 16;
    AggregationStore store;
    CallRecorder recorder(config, store);

    recorder.instrument("app.args", [](int, const std::string&) {}, 7, std::string("x"));
    recorder.instrument("app.opaque", [](Opaque) {}, Opaque{1});
    recorder.instrument("app.long", [](const std::string&) {}, std::string(100, 'a'));

    auto args = store.all_records("app.args");
    assert(args.size() == 1);
    assert(args[0].arguments.has_value());
    assert(*args[0].arguments == "[7,\"x\"]");

    auto opaque = store.all_records("app.opaque");
    assert(*opaque[0].arguments == "[\"<opaque>\"]");

    auto longer = store.all_records("app.long");
    assert(longer[0].arguments->size() == 16 + 3);
    assert(longer[0].arguments->substr(16) == "...");

    std::printf("PASS\n");
}

// -- return value capture ---------------------------------------------------------------

static void test_return_value_capture() {
    std::printf("test_return_value_capture ... ");

    auto config = base_config();
    config.filters.track_return_values = true;
    config.filters.max_argument_length = 12;
    AggregationStore store;
    CallRecorder recorder(config, store);

    int sum = recorder.instrument("math.add", [](int a, int b) { return a + b; }, 2, 3);
    assert(sum == 5);
    std::string text = recorder.instrument("text.make", [] { return std::string(20, 'z'); });
    assert(text.size() == 20);
    recorder.instrument("app.opaque", [] { return Opaque{3}; });
    recorder.instrument("app.void", [] {});

    int value = 1;
    int& ref = recorder.instrument("mem.ref", [&value]() -> int& { return value; });
    ref = 9;
    assert(value == 9);

    assert(*store.all_records("math.add")[0].return_value == "5");
    auto made = store.all_records("text.make")[0].return_value;
    assert(made.has_value() && *made == "\"zzzzzzzzzzz...");
    assert(*store.all_records("app.opaque")[0].return_value == "\"<opaque>\"");
    assert(!store.all_records("app.void")[0].return_value.has_value());
    assert(*store.all_records("mem.ref")[0].return_value == "1");

    // Off by default
    auto plain = base_config();
    AggregationStore plain_store;
    CallRecorder plain_recorder(plain, plain_store);
    plain_recorder.instrument("math.add", [](int a, int b) { return a + b; }, 2, 3);
    assert(!plain_store.all_records("math.add")[0].return_value.has_value());

    auto round_trip = CallRecord::from_json(store.all_records("math.add")[0].to_json());
    assert(round_trip.return_value == std::optional<std::string>("5"));

    std::printf("PASS\n");
}

// -- scoped block and macro ------------------------------------------------------------

static void scoped_work(CallRecorder& recorder) {
    CLOCKWORK_TRACK(recorder, "jobs");
    sleep_ms(2);
}

static void test_scoped_call() {
    std::printf("test_scoped_call ... ");

    auto config = base_config();
    AggregationStore store;
    CallRecorder recorder(config, store);

    int notified = 0;
    recorder.set_on_recorded([&notified] { ++notified; });

    scoped_work(recorder);
    {
        ScopedCall scope(recorder, "db.pool.acquire");
        assert(scope.active());
    }

    assert(store.summary("jobs.scoped_work").has_value());
    auto acquire = store.all_records("db.pool.acquire");
    assert(acquire.size() == 1);
    assert(acquire[0].module == "db.pool");
    assert(acquire[0].function == "acquire");
    assert(notified == 2);

    std::printf("PASS\n");
}

// -- threads -------------------------------------------------------------------------

static void test_concurrent_calls() {
    std::printf("test_concurrent_calls ... ");

    auto config = base_config();
    config.max_tracked_calls = 500;
    AggregationStore store;
    CallRecorder recorder(config, store);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&recorder] {
            for (int i = 0; i < 200; ++i) {
                recorder.instrument("pool.task", [] {});
            }
        });
    }
    for (auto& th : threads) th.join();

    // Limit holds exactly under contention
    assert(store.size() == 500);
    assert(recorder.tracked_calls() == 500);

    std::printf("PASS\n");
}

int main() {
    clockwork::testing::quiet_logs();
    std::printf("=== clockwork - CallRecorder ===\n\n");

    test_instrument_returns_value();
    test_min_execution_time();
    test_min_execution_time_boundary();
    test_exception_propagates();
    test_call_limit();
    test_filters();
    test_disabled();
    test_argument_capture();
    test_return_value_capture();
    test_scoped_call();
    test_concurrent_calls();

    std::printf("\nAll 11 tests passed.\n");
    return 0;
}
