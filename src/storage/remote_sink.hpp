#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "storage/sink.hpp"
#include "storage/table_client.hpp"
#include "tracker/config.hpp"

namespace clockwork::storage {

/**
 * Pushes one aggregated item per flush into a keyed remote table.
 *
 * The first write checks that the table exists and, when configured to,
 * creates it. Another process creating the same table concurrently is
 * tolerated: "already exists" counts as success.
 */
class RemoteSink : public Sink {
public:
    RemoteSink(tracker::RemoteStorageConfig config, std::unique_ptr<TableClient> client);

    DeliveryResult write(const std::string& session_id,
                         const std::vector<tracker::CallRecord>& records,
                         const FlushMetadata& metadata) override;

    const char* name() const override { return "remote"; }

    // Strictly increasing key derived from a microsecond timestamp
    uint64_t next_key();

private:
    tracker::RemoteStorageConfig config_;
    std::unique_ptr<TableClient> client_;
    bool table_ready_ = false;
    uint64_t last_key_ = 0;
    std::mutex mutex_;

    DeliveryResult ensure_table();
};

} // namespace clockwork::storage
