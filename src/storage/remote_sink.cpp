#include "storage/remote_sink.hpp"
#include "core/clock.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace clockwork::storage {

namespace {

DeliveryResult to_delivery(const TableResult& result) {
    switch (result.status) {
        case TableStatus::OK:
        case TableStatus::ALREADY_EXISTS:
            return DeliveryResult::delivered();
        case TableStatus::PERMANENT_ERROR:
            return DeliveryResult::permanent(result.message);
        case TableStatus::NOT_FOUND:        // table still being created
        case TableStatus::TRANSIENT_ERROR:
        default:
            return DeliveryResult::transient(result.message);
    }
}

} // namespace

RemoteSink::RemoteSink(tracker::RemoteStorageConfig config, std::unique_ptr<TableClient> client)
    : config_(std::move(config))
    , client_(std::move(client)) {}

uint64_t RemoteSink::next_key() {
    auto now_us = static_cast<uint64_t>(core::to_epoch_us(std::chrono::system_clock::now()));
    last_key_ = std::max(now_us, last_key_ + 1);
    return last_key_;
}

DeliveryResult RemoteSink::ensure_table() {
    if (table_ready_) {
        return DeliveryResult::delivered();
    }

    auto described = client_->describe_table(config_.table_name);
    if (described.ok()) {
        table_ready_ = true;
        return DeliveryResult::delivered();
    }

    if (described.status != TableStatus::NOT_FOUND) {
        return to_delivery(described);
    }

    if (!config_.auto_create_table) {
        return DeliveryResult::permanent("table " + config_.table_name +
                                         " does not exist and auto_create_table is off");
    }

    TableSpec spec;
    spec.name = config_.table_name;
    spec.read_capacity = config_.read_capacity;
    spec.write_capacity = config_.write_capacity;

    auto created = client_->create_table(spec);
    if (created.ok() || created.status == TableStatus::ALREADY_EXISTS) {
        spdlog::info("Table {} ready", config_.table_name);
        table_ready_ = true;
        return DeliveryResult::delivered();
    }

    // NOT_FOUND from create is not meaningful; treat as retryable
    return to_delivery(created);
}

DeliveryResult RemoteSink::write(const std::string& session_id,
                                 const std::vector<tracker::CallRecord>& records,
                                 const FlushMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ready = ensure_table();
    if (!ready.ok()) {
        return ready;
    }

    auto totals = compute_totals(records);

    TableItem item;
    item.id = next_key();
    item.session_id = session_id;
    item.upload_timestamp = core::format_iso8601(metadata.flushed_at);
    item.hostname = metadata.hostname;
    item.total_calls = totals.total_calls;
    item.total_wall_time = totals.total_wall_time;
    item.total_cpu_time = totals.total_cpu_time;
    try {
        item.data = encode_batch(session_id, records, metadata)
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return DeliveryResult::permanent(std::string("serialization failed: ") + e.what());
    }

    auto result = client_->put_item(config_.table_name, item);
    if (result.ok()) {
        spdlog::info("Uploaded {} records to {} (id={})", records.size(), config_.table_name, item.id);
        return DeliveryResult::delivered();
    }
    if (result.status == TableStatus::NOT_FOUND) {
        // Deleted behind our back; check again next time
        table_ready_ = false;
    }
    return to_delivery(result);
}

} // namespace clockwork::storage
