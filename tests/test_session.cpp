// ============================================================================
// clockwork - Session end-to-end tests
// ============================================================================
#include "session/session.hpp"
#include "storage/local_sink.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace clockwork;
using clockwork::testing::TempDir;

static void sleep_secs(double s) {
    std::this_thread::sleep_for(std::chrono::duration<double>(s));
}

static tracker::TrackerConfig local_config(const TempDir& dir) {
    tracker::TrackerConfig config;
    config.local.data_dir = (dir.path() / "perf").string();
    config.correlation.sampler_data_dir = (dir.path() / "sampler").string();
    config.logging.level = "ERROR";
    return config;
}

// -- threshold end to end ------------------------------------------------------------

static void test_fast_and_slow_functions() {
    std::printf("test_fast_and_slow_functions ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.01;

    std::filesystem::path perf_dir = dir.path() / "perf";
    {
        Session session(config);
        auto fast = session.wrap("demo.fast", [] { sleep_secs(0.005); });
        auto slow = session.wrap("demo.slow", [] { sleep_secs(0.02); });

        for (int i = 0; i < 5; ++i) fast();
        for (int i = 0; i < 3; ++i) slow();

        assert(!session.summary("demo.fast").has_value());
        auto s = session.summary("demo.slow");
        assert(s.has_value());
        assert(s->call_count == 3);
        assert(s->wall_time.total >= 0.06);
        assert(s->wall_time.min >= 0.02);

        // on_exit: nothing written yet
        assert(clockwork::testing::count_files(perf_dir, ".json") == 0);

        auto text = session.render_summary();
        assert(text.find("demo.slow") != std::string::npos);
        assert(text.find("demo.fast") == std::string::npos);
        assert(text.find(session.info().session_id) != std::string::npos);

        auto results = session.results();
        assert(results["records"].size() == 3);
        assert(results["summaries"]["demo.slow"]["call_count"] == 3);
    }

    // Released by the destructor: exactly one flush file
    storage::LocalSink reader([&] {
        tracker::LocalStorageConfig c;
        c.data_dir = perf_dir.string();
        return c;
    }());
    auto files = reader.list_files();
    assert(files.size() == 1);
    auto records = storage::LocalSink::read_records(files[0]);
    assert(records.size() == 3);
    for (const auto& r : records) {
        assert(r.qualified_name == "demo.slow");
    }

    std::printf("PASS\n");
}

// -- release is idempotent -------------------------------------------------------------

static void test_release_once() {
    std::printf("test_release_once ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.0;

    Session session(config);
    session.instrument("app.init", [] {});
    session.release();
    assert(session.released());
    assert(session.store().empty());
    assert(session.uploads().flush_count() == 1);

    session.release();
    assert(session.uploads().flush_count() == 1);
    assert(clockwork::testing::count_files(dir.path() / "perf", ".json") == 1);

    std::printf("PASS\n");
}

// -- exceptions through a session -------------------------------------------------------

static void test_exception_through_session() {
    std::printf("test_exception_through_session ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.0;
    config.upload.strategy = tracker::UploadStrategy::MANUAL;

    Session session(config);
    bool caught = false;
    try {
        session.instrument("calc.average", [](const std::vector<int>& v) {
            if (v.empty()) throw std::invalid_argument("empty input");
            return 0;
        }, std::vector<int>{});
    } catch (const std::invalid_argument&) {
        caught = true;
    }
    assert(caught);
    auto records = session.store().all_records("calc.average");
    assert(records.size() == 1 && records[0].raised);

    // manual: release leaves records unflushed
    session.release();
    assert(session.store().size() == 1);
    assert(clockwork::testing::count_files(dir.path() / "perf", ".json") == 0);

    std::printf("PASS\n");
}

// -- real_time strategy ------------------------------------------------------------------

static void test_real_time_session() {
    std::printf("test_real_time_session ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.0;
    config.upload.strategy = tracker::UploadStrategy::REAL_TIME;

    Session session(config);
    for (int i = 0; i < 3; ++i) {
        session.instrument("net.send", [] {});
    }
    assert(session.store().empty());
    assert(clockwork::testing::count_files(dir.path() / "perf", ".json") == 3);

    std::printf("PASS\n");
}

// -- remote failure falls back to local ---------------------------------------------------

class DownSink : public storage::Sink {
public:
    int writes = 0;
    storage::DeliveryResult write(const std::string&, const std::vector<tracker::CallRecord>&,
                                  const storage::FlushMetadata&) override {
        ++writes;
        return storage::DeliveryResult::transient("connection refused");
    }
    const char* name() const override { return "down"; }
};

static void test_fallback_on_exit() {
    std::printf("test_fallback_on_exit ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.0;
    config.backend = tracker::StorageBackend::REMOTE;
    config.upload.retry_attempts = 2;
    config.upload.backoff_initial_ms = 1;

    auto down = std::make_unique<DownSink>();
    auto* primary = down.get();
    {
        Session session(config, std::move(down), std::make_unique<storage::LocalSink>(config.local));
        session.instrument("api.call", [] {});
        session.instrument("api.call", [] {});
        session.release();
        assert(primary->writes == 2);
        assert(session.store().empty());
    }
    assert(clockwork::testing::count_files(dir.path() / "perf", ".json") == 1);

    std::printf("PASS\n");
}

// -- correlation without a sampler ----------------------------------------------------------

static void test_correlate_without_sampler() {
    std::printf("test_correlate_without_sampler ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.min_execution_time = 0.0;
    config.upload.strategy = tracker::UploadStrategy::MANUAL;

    Session session(config);
    session.instrument("job.run", [] {});
    auto report = session.correlate();
    assert(!report.daemon_available);
    assert(report.functions.at("job.run").summary.call_count == 1);
    assert(!report.functions.at("job.run").load.has_value());
    assert(report.window_start == session.info().start_time);

    std::printf("PASS\n");
}

// -- disabled -----------------------------------------------------------------------------------

static void test_disabled_session() {
    std::printf("test_disabled_session ... ");

    TempDir dir;
    auto config = local_config(dir);
    config.enabled = false;

    Session session(config);
    int v = session.instrument("app.work", [] { sleep_secs(0.002); return 9; });
    assert(v == 9);
    assert(session.summaries().empty());
    session.release();
    assert(clockwork::testing::count_files(dir.path() / "perf", ".json") == 0);

    std::printf("PASS\n");
}

int main() {
    std::printf("=== clockwork - Session ===\n\n");

    test_fast_and_slow_functions();
    test_release_once();
    test_exception_through_session();
    test_real_time_session();
    test_fallback_on_exit();
    test_correlate_without_sampler();
    test_disabled_session();

    std::printf("\nAll 7 tests passed.\n");
    return 0;
}
