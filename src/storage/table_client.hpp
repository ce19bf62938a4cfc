#pragma once
#include <cstdint>
#include <string>

namespace clockwork::storage {

enum class TableStatus {
    OK,
    NOT_FOUND,          // table does not exist
    ALREADY_EXISTS,     // create raced with another creator
    TRANSIENT_ERROR,    // timeout, throttling, network
    PERMANENT_ERROR     // credentials, permissions, validation
};

const char* table_status_to_string(TableStatus status);

struct TableResult {
    TableStatus status = TableStatus::OK;
    std::string message;

    bool ok() const { return status == TableStatus::OK; }
};

struct TableSpec {
    std::string name;
    std::string key_attribute = "id";   // numeric hash key
    uint32_t read_capacity = 5;
    uint32_t write_capacity = 5;
};

// One flush as stored remotely. Summary fields sit beside the payload so
// rows can be filtered without decoding it.
struct TableItem {
    uint64_t id = 0;
    std::string session_id;
    std::string upload_timestamp;      // ISO-8601 UTC
    std::string hostname;
    std::string data;                  // serialized batch
    uint64_t total_calls = 0;
    double total_wall_time = 0.0;
    double total_cpu_time = 0.0;
};

// Keyed remote table backend.
class TableClient {
public:
    virtual ~TableClient() = default;

    virtual TableResult describe_table(const std::string& table) = 0;
    virtual TableResult create_table(const TableSpec& spec) = 0;
    virtual TableResult put_item(const std::string& table, const TableItem& item) = 0;
};

} // namespace clockwork::storage
