#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "storage/table_client.hpp"
#include "tracker/config.hpp"

namespace clockwork::storage {

// Output of one child process run.
struct CommandResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool spawn_failed = false;
};

// Run argv[0] with arguments, capturing stdout/stderr. The child is killed
// once the timeout expires.
CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout);

/**
 * DynamoDB table access through the AWS command line.
 *
 * Each operation runs `aws dynamodb <op>` as a child process and maps
 * the service error code found on stderr onto a TableStatus.
 */
class AwsCliTableClient : public TableClient {
public:
    AwsCliTableClient(tracker::RemoteStorageConfig config, std::chrono::milliseconds timeout);

    TableResult describe_table(const std::string& table) override;
    TableResult create_table(const TableSpec& spec) override;
    TableResult put_item(const std::string& table, const TableItem& item) override;

    // DynamoDB attribute-value form of an item
    static nlohmann::json to_attribute_map(const TableItem& item);

    // Map a failed command onto a table status
    static TableResult classify(const CommandResult& result);

private:
    tracker::RemoteStorageConfig config_;
    std::chrono::milliseconds timeout_;

    std::vector<std::string> base_command(const std::string& operation) const;
};

} // namespace clockwork::storage
