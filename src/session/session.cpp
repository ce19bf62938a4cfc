#include "session/session.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "storage/aws_cli_table_client.hpp"
#include "storage/local_sink.hpp"
#include "storage/remote_sink.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace clockwork {

namespace {

std::unique_ptr<storage::Sink> make_primary_sink(const tracker::TrackerConfig& config) {
    if (config.backend == tracker::StorageBackend::REMOTE) {
        auto timeout = std::chrono::milliseconds(
            static_cast<int64_t>(config.upload.timeout_secs * 1000.0));
        return std::make_unique<storage::RemoteSink>(
            config.remote, std::make_unique<storage::AwsCliTableClient>(config.remote, timeout));
    }
    return std::make_unique<storage::LocalSink>(config.local);
}

// Remote uploads fall back to local files
std::unique_ptr<storage::Sink> make_fallback_sink(const tracker::TrackerConfig& config) {
    if (config.backend == tracker::StorageBackend::REMOTE) {
        return std::make_unique<storage::LocalSink>(config.local);
    }
    return nullptr;
}

tracker::SessionInfo new_session_info() {
    tracker::SessionInfo info;
    info.session_id = tracker::generate_session_id();
    info.hostname = core::paths::hostname();
    info.start_time = std::chrono::system_clock::now();
    return info;
}

} // namespace

Session::Session(tracker::TrackerConfig config)
    : Session(config, make_primary_sink(config), make_fallback_sink(config)) {}

Session::Session(tracker::TrackerConfig config,
                 std::unique_ptr<storage::Sink> primary,
                 std::unique_ptr<storage::Sink> fallback)
    : config_(std::move(config))
    , info_(new_session_info())
    , primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , recorder_(config_, store_) {
    core::init_logger(config_.logging);

    if (!primary_) {
        primary_ = std::make_unique<storage::LocalSink>(config_.local);
    }
    uploads_ = std::make_unique<upload::UploadController>(
        config_.upload, store_, info_, *primary_, fallback_.get());
    wire();

    spdlog::info("Session {} started on {} (enabled={}, backend={}, strategy={})",
                 info_.session_id, info_.hostname, config_.enabled,
                 tracker::storage_backend_to_string(config_.backend),
                 tracker::upload_strategy_to_string(config_.upload.strategy));
}

Session::~Session() {
    release();
}

void Session::wire() {
    upload::UploadController* uploads = uploads_.get();
    recorder_.set_on_recorded([uploads] { uploads->on_record(); });
}

std::optional<tracker::FunctionSummary> Session::summary(const std::string& qualified_name) const {
    return store_.summary(qualified_name);
}

std::map<std::string, tracker::FunctionSummary> Session::summaries() const {
    return store_.summaries();
}

nlohmann::json Session::results() const {
    nlohmann::json j{
        {"session", info_.to_json()},
        {"summaries", nlohmann::json::object()},
        {"records", nlohmann::json::array()}
    };
    for (const auto& [name, summary] : store_.summaries()) {
        j["summaries"][name] = summary.to_json();
    }
    for (const auto& record : store_.all_records()) {
        j["records"].push_back(record.to_json());
    }
    return j;
}

void Session::clear_results() {
    uploads_->discard();
}

upload::FlushResult Session::flush() {
    return uploads_->flush();
}

void Session::tick() {
    uploads_->tick();
}

correlate::CorrelationReport Session::correlate() const {
    return correlate(info_.start_time, std::chrono::system_clock::now());
}

correlate::CorrelationReport Session::correlate(std::chrono::system_clock::time_point start,
                                                std::chrono::system_clock::time_point end) const {
    correlate::Correlator correlator(config_.correlation);
    return correlator.correlate(store_, start, end);
}

std::string Session::render_summary() const {
    auto all = store_.summaries();
    std::vector<tracker::FunctionSummary> rows;
    rows.reserve(all.size());
    for (auto& [name, summary] : all) {
        rows.push_back(std::move(summary));
    }
    std::sort(rows.begin(), rows.end(),
              [](const tracker::FunctionSummary& a, const tracker::FunctionSummary& b) {
                  return a.wall_time.total > b.wall_time.total;
              });

    std::string out = fmt::format("Session {} on {}\n", info_.session_id, info_.hostname);
    if (rows.empty()) {
        out += "  no calls recorded\n";
        return out;
    }

    out += fmt::format("  {:<40} {:>8} {:>12} {:>12} {:>12} {:>12} {:>12}\n",
                       "function", "calls", "total (s)", "avg (s)", "min (s)", "max (s)", "cpu (s)");
    for (const auto& row : rows) {
        out += fmt::format("  {:<40} {:>8} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f}\n",
                           row.qualified_name, row.call_count,
                           row.wall_time.total, row.wall_time.average,
                           row.wall_time.min, row.wall_time.max, row.cpu_time.total);
    }
    return out;
}

void Session::release() {
    if (released_) {
        return;
    }
    released_ = true;

    auto result = uploads_->finish();
    if (result.attempted && !result.fell_back && result.status != storage::DeliveryStatus::DELIVERED) {
        spdlog::error("Exit flush of session {} failed: {}", info_.session_id, result.error);
    }
    spdlog::info("Session {} released ({} records recorded, {} flushes)",
                 info_.session_id, recorder_.tracked_calls(), uploads_->flush_count());
}

} // namespace clockwork
