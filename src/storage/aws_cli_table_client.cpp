#include "storage/aws_cli_table_client.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace clockwork::storage {

const char* table_status_to_string(TableStatus status) {
    switch (status) {
        case TableStatus::OK:              return "OK";
        case TableStatus::NOT_FOUND:       return "NOT_FOUND";
        case TableStatus::ALREADY_EXISTS:  return "ALREADY_EXISTS";
        case TableStatus::TRANSIENT_ERROR: return "TRANSIENT_ERROR";
        case TableStatus::PERMANENT_ERROR: return "PERMANENT_ERROR";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Child process helper
// ============================================================================

CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.spawn_failed = true;
        return result;
    }

    // Built before fork; the child must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    // Close-on-exec so concurrent children never inherit each other's pipes
    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        spdlog::error("Failed to create stdout pipe: {}", std::strerror(errno));
        result.spawn_failed = true;
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        spdlog::error("Failed to create stderr pipe: {}", std::strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        result.spawn_failed = true;
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Failed to fork {}: {}", argv[0], std::strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        result.spawn_failed = true;
        return result;
    }

    if (pid == 0) {
        // Child process: async-signal-safe calls only
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        // dup2 clears close-on-exec on the targets
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());

        // If exec fails
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    int fds[2] = {stdout_pipe[0], stderr_pipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    bool open_fds[2] = {true, true};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];

    while (open_fds[0] || open_fds[1]) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            kill(pid, SIGKILL);
            break;
        }

        struct pollfd pfds[2];
        for (int i = 0; i < 2; ++i) {
            pfds[i].fd = open_fds[i] ? fds[i] : -1;
            pfds[i].events = POLLIN;
            pfds[i].revents = 0;
        }

        int rc = poll(pfds, 2, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed while waiting for {}: {}", argv[0], std::strerror(errno));
            kill(pid, SIGKILL);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (!open_fds[i] || pfds[i].revents == 0) continue;
            ssize_t n = read(fds[i], buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                open_fds[i] = false;
            }
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed for {}: {}", argv[0], std::strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127 && !result.timed_out) {
            result.spawn_failed = true;
        }
    }
    return result;
}

// ============================================================================
// AwsCliTableClient
// ============================================================================

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) return true;
    }
    return false;
}

std::string first_line(const std::string& text) {
    auto start = text.find_first_not_of(" \r\n\t");
    if (start == std::string::npos) return std::string();
    auto end = text.find('\n', start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

AwsCliTableClient::AwsCliTableClient(tracker::RemoteStorageConfig config, std::chrono::milliseconds timeout)
    : config_(std::move(config))
    , timeout_(timeout) {}

std::vector<std::string> AwsCliTableClient::base_command(const std::string& operation) const {
    std::vector<std::string> argv = {config_.cli_path, "dynamodb", operation,
                                     "--region", config_.region,
                                     "--output", "json"};
    if (!config_.profile.empty()) {
        argv.push_back("--profile");
        argv.push_back(config_.profile);
    }
    return argv;
}

TableResult AwsCliTableClient::classify(const CommandResult& result) {
    if (result.spawn_failed) {
        return {TableStatus::PERMANENT_ERROR, "could not run the AWS CLI"};
    }
    if (result.timed_out) {
        return {TableStatus::TRANSIENT_ERROR, "AWS CLI call timed out"};
    }
    if (result.exit_code == 0) {
        return {TableStatus::OK, ""};
    }

    const std::string& err = result.stderr_text;
    std::string message = first_line(err);
    if (message.empty()) {
        message = "AWS CLI exited with code " + std::to_string(result.exit_code);
    }

    if (contains_any(err, {"ResourceNotFoundException"})) {
        return {TableStatus::NOT_FOUND, message};
    }
    if (contains_any(err, {"ResourceInUseException", "Table already exists"})) {
        return {TableStatus::ALREADY_EXISTS, message};
    }
    if (contains_any(err, {"AccessDenied", "UnrecognizedClientException", "ValidationException",
                           "InvalidSignatureException", "Unable to locate credentials",
                           "ExpiredToken", "MissingAuthenticationToken"})) {
        return {TableStatus::PERMANENT_ERROR, message};
    }
    if (contains_any(err, {"ThrottlingException", "ProvisionedThroughputExceededException",
                           "RequestLimitExceeded", "InternalServerError", "ServiceUnavailable",
                           "Could not connect", "Connect timeout", "Read timeout",
                           "EndpointConnectionError"})) {
        return {TableStatus::TRANSIENT_ERROR, message};
    }

    // Unknown failures are retried; exhausted retries fall back to local storage
    return {TableStatus::TRANSIENT_ERROR, message};
}

TableResult AwsCliTableClient::describe_table(const std::string& table) {
    auto argv = base_command("describe-table");
    argv.push_back("--table-name");
    argv.push_back(table);
    return classify(run_command(argv, timeout_));
}

TableResult AwsCliTableClient::create_table(const TableSpec& spec) {
    auto argv = base_command("create-table");
    argv.insert(argv.end(), {
        "--table-name", spec.name,
        "--attribute-definitions", "AttributeName=" + spec.key_attribute + ",AttributeType=N",
        "--key-schema", "AttributeName=" + spec.key_attribute + ",KeyType=HASH",
        "--provisioned-throughput",
        "ReadCapacityUnits=" + std::to_string(spec.read_capacity) +
            ",WriteCapacityUnits=" + std::to_string(spec.write_capacity)
    });

    auto created = classify(run_command(argv, timeout_));
    if (!created.ok()) {
        return created;
    }

    spdlog::info("Created table {}, waiting for it to become active", spec.name);
    auto wait_argv = base_command("wait");
    wait_argv.insert(wait_argv.begin() + 3, "table-exists");
    wait_argv.push_back("--table-name");
    wait_argv.push_back(spec.name);
    return classify(run_command(wait_argv, timeout_));
}

nlohmann::json AwsCliTableClient::to_attribute_map(const TableItem& item) {
    return nlohmann::json{
        {"id", {{"N", std::to_string(item.id)}}},
        {"session_id", {{"S", item.session_id}}},
        {"upload_timestamp", {{"S", item.upload_timestamp}}},
        {"hostname", {{"S", item.hostname}}},
        {"data", {{"S", item.data}}},
        {"total_calls", {{"N", std::to_string(item.total_calls)}}},
        {"total_wall_time", {{"N", std::to_string(item.total_wall_time)}}},
        {"total_cpu_time", {{"N", std::to_string(item.total_cpu_time)}}}
    };
}

TableResult AwsCliTableClient::put_item(const std::string& table, const TableItem& item) {
    // Payloads can exceed the argv size limit, so the item goes through a file
    char path[] = "/tmp/clockwork-item-XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        return {TableStatus::TRANSIENT_ERROR, std::string("mkstemp failed: ") + std::strerror(errno)};
    }

    std::string body = to_attribute_map(item).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    size_t written = 0;
    while (written < body.size()) {
        ssize_t n = ::write(fd, body.data() + written, body.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            close(fd);
            unlink(path);
            return {TableStatus::TRANSIENT_ERROR, "failed to stage item: " + err};
        }
        written += static_cast<size_t>(n);
    }
    close(fd);

    auto argv = base_command("put-item");
    argv.push_back("--table-name");
    argv.push_back(table);
    argv.push_back("--item");
    argv.push_back(std::string("file://") + path);

    auto result = classify(run_command(argv, timeout_));
    if (unlink(path) != 0) {
        spdlog::debug("Could not remove staged item {}: {}", path, std::strerror(errno));
    }
    return result;
}

} // namespace clockwork::storage
