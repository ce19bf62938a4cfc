// ============================================================================
// clockwork - AggregationStore tests
// ============================================================================
#include "tracker/aggregation_store.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <thread>
#include <vector>

using namespace clockwork::tracker;

static CallRecord make_record(const std::string& name, double wall, double cpu, int64_t t_ms) {
    CallRecord r;
    r.qualified_name = name;
    auto dot = name.rfind('.');
    r.module = name.substr(0, dot);
    r.function = name.substr(dot + 1);
    r.wall_time = wall;
    r.cpu_time = cpu;
    r.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(t_ms));
    return r;
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

// -- summary statistics -------------------------------------------------------

static void test_summary_stats() {
    std::printf("test_summary_stats ... ");

    AggregationStore store;
    store.record(make_record("app.load", 0.10, 0.05, 1000));
    store.record(make_record("app.load", 0.30, 0.15, 2000));
    store.record(make_record("app.load", 0.20, 0.10, 3000));
    store.record(make_record("app.save", 0.50, 0.40, 1500));

    auto s = store.summary("app.load");
    assert(s.has_value());
    assert(s->call_count == 3);
    assert(near(s->wall_time.total, 0.60));
    assert(near(s->wall_time.average, 0.20));
    assert(near(s->wall_time.min, 0.10));
    assert(near(s->wall_time.max, 0.30));
    assert(near(s->cpu_time.total, 0.30));
    assert(near(s->cpu_time.max, 0.15));

    assert(!store.summary("app.missing").has_value());

    auto all = store.summaries();
    assert(all.size() == 2);
    assert(all.at("app.save").call_count == 1);
    assert(store.size() == 4);

    std::printf("PASS\n");
}

// -- all_records ordering ------------------------------------------------------

static void test_all_records_ordered_by_time() {
    std::printf("test_all_records_ordered_by_time ... ");

    AggregationStore store;
    store.record(make_record("a.f", 0.1, 0.1, 3000));
    store.record(make_record("b.g", 0.1, 0.1, 1000));
    store.record(make_record("a.f", 0.1, 0.1, 2000));

    auto records = store.all_records();
    assert(records.size() == 3);
    assert(records[0].qualified_name == "b.g");
    assert(records[1].timestamp < records[2].timestamp);

    auto only_f = store.all_records("a.f");
    assert(only_f.size() == 2);
    assert(store.all_records("nope").empty());

    std::printf("PASS\n");
}

// -- clear_flushed keeps newer records ----------------------------------------

static void test_clear_flushed_keeps_late_records() {
    std::printf("test_clear_flushed_keeps_late_records ... ");

    AggregationStore store;
    store.record(make_record("app.load", 0.1, 0.1, 1000));
    store.record(make_record("app.save", 0.2, 0.1, 1100));

    auto snap = store.snapshot();
    assert(snap.total == 2);

    // Arrives while the snapshot is being delivered
    store.record(make_record("app.load", 0.3, 0.1, 1200));
    store.record(make_record("app.other", 0.4, 0.1, 1300));

    store.clear_flushed(snap);
    assert(store.size() == 2);

    auto load = store.all_records("app.load");
    assert(load.size() == 1);
    assert(near(load[0].wall_time, 0.3));
    assert(!store.summary("app.save").has_value());
    assert(store.summary("app.other").has_value());

    store.clear();
    assert(store.empty());

    std::printf("PASS\n");
}

// -- a clear() between snapshot and acknowledgement --------------------------

static void test_clear_during_delivery() {
    std::printf("test_clear_during_delivery ... ");

    AggregationStore store;
    for (int i = 0; i < 5; ++i) {
        store.record(make_record("app.load", 0.1, 0.1, 1000 + i));
    }
    auto snap = store.snapshot();
    assert(snap.total == 5);

    store.clear();
    store.record(make_record("app.load", 0.2, 0.1, 2000));
    store.record(make_record("app.load", 0.3, 0.1, 2100));

    store.clear_flushed(snap);
    assert(store.size() == 2);
    auto load = store.all_records("app.load");
    assert(load.size() == 2);
    assert(near(load[0].wall_time, 0.2));

    std::printf("PASS\n");
}

// -- concurrent recording ------------------------------------------------------

static void test_concurrent_record() {
    std::printf("test_concurrent_record ... ");

    AggregationStore store;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i) {
                store.record(make_record(t % 2 == 0 ? "mod.even" : "mod.odd", 0.001, 0.0, i));
                if (i % 100 == 0) {
                    auto summaries = store.summaries();
                    (void)summaries;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(store.size() == kThreads * kPerThread);
    assert(store.summary("mod.even")->call_count == 2 * kPerThread);
    assert(store.summary("mod.odd")->call_count == 2 * kPerThread);

    std::printf("PASS\n");
}

int main() {
    std::printf("=== clockwork - AggregationStore ===\n\n");

    test_summary_stats();
    test_all_records_ordered_by_time();
    test_clear_flushed_keeps_late_records();
    test_clear_during_delivery();
    test_concurrent_record();

    std::printf("\nAll 5 tests passed.\n");
    return 0;
}
