/**
 * clockwork-sampler
 *
 * Usage:
 *   clockwork-sampler [run|stop|status] [config.json]
 *
 *   run     sample system metrics until SIGTERM/SIGINT (default)
 *   stop    signal the sampler owning the configured data directory
 *   status  print that sampler's status file as JSON
 */

#include "core/logger.hpp"
#include "sampler/config.hpp"
#include "sampler/sampler_daemon.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

using namespace clockwork;

// ============================================================================
// Signal handling
// ============================================================================

static std::atomic<sampler::SamplerDaemon*> g_daemon{nullptr};

extern "C" void handle_shutdown(int /*sig*/) {
    auto* daemon = g_daemon.load(std::memory_order_acquire);
    if (daemon) daemon->request_stop();
}

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [run|stop|status] [config.json]\n";
}

static bool load_config(const std::string& path, sampler::SamplerConfig& config) {
    nlohmann::json j = nlohmann::json::object();
    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            spdlog::error("Cannot open config file {}", path);
            return false;
        }
        try {
            j = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Invalid config file {}: {}", path, e.what());
            return false;
        }
    }
    config = sampler::SamplerConfig::from_json(j);
    config.apply_env_overrides();
    return true;
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_run(const sampler::SamplerConfig& config) {
    struct sigaction sa{};
    sa.sa_handler = handle_shutdown;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    sampler::SamplerDaemon daemon(config);
    g_daemon.store(&daemon, std::memory_order_release);

    if (!daemon.start()) {
        g_daemon.store(nullptr, std::memory_order_release);
        spdlog::error("Sampler failed to start");
        return 1;
    }

    bool ok = daemon.run();
    g_daemon.store(nullptr, std::memory_order_release);
    return ok ? 0 : 1;
}

static int cmd_stop(const sampler::SamplerConfig& config) {
    return sampler::signal_daemon_stop(config.data_dir) ? 0 : 1;
}

static int cmd_status(const sampler::SamplerConfig& config) {
    auto status = sampler::read_daemon_status(config.data_dir);
    if (!status) {
        std::cout << nlohmann::json{{"state", "STOPPED"}, {"data_dir", config.data_dir}}.dump(2) << "\n";
        return 1;
    }
    std::cout << status->to_json().dump(2) << "\n";
    return status->state == sampler::DaemonState::RUNNING ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    core::init_logger();

    std::string command = "run";
    std::string config_path;

    int i = 1;
    if (i < argc) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "run" || arg == "stop" || arg == "status") {
            command = arg;
            ++i;
        }
    }
    if (i < argc) {
        config_path = argv[i++];
    }
    if (i < argc) {
        print_usage(argv[0]);
        return 2;
    }

    sampler::SamplerConfig config;
    if (!load_config(config_path, config)) {
        return 2;
    }
    core::init_logger(config.logging);

    if (command == "stop") return cmd_stop(config);
    if (command == "status") return cmd_status(config);
    return cmd_run(config);
}
