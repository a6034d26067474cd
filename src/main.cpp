#include "bridge.hpp"
#include "config.hpp"
#include "core/bus/mqtt_bus.h"
#include "core/transport/uh1_connection.h"
#include "include/errors.hpp"
#include "include/log.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace hmbridge;

namespace {

std::atomic<bool> g_stop{false};
std::atomic<int> g_signal{0};

void handle_signal(int signum) {
    g_signal.store(signum);
    g_stop.store(true);
}

} // namespace

int main(int argc, char** argv) {
    const std::string path = (argc >= 2) ? argv[1] : "options.json";

    BridgeConfig cfg;
    try {
        cfg = load_config(path);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    bool level_ok = true;
    logging::set_level(logging::parse_level(cfg.log_level, &level_ok));
    if (!level_ok) logging::warning("Main") << "Unknown log_level '" << cfg.log_level << "', using INFO";
    if (!cfg.log_file.empty() && !logging::open_file(cfg.log_file)) {
        logging::warning("Main") << "Cannot open log file " << cfg.log_file << "; logging to stdout only";
    }

    logging::info("Main") << "Starting Heatmiser bridge";

    std::unique_ptr<Connection> conn;
    try {
        conn = std::make_unique<Uh1Connection>(cfg.hub);
    } catch (const ConfigError& e) {
        logging::error("Main") << "Configuration error: " << e.what();
        return 1;
    }

    MqttBus bus(cfg.bus.client);
    Bridge bridge(cfg, std::move(conn), bus);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    if (!bridge.start()) {
        logging::error("Main") << "Bridge failed to start";
        return 1;
    }
    logging::info("Main") << "Bridge started. Running until stopped...";

    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logging::info("Main") << "Received signal " << g_signal.load() << ", shutting down";
    bridge.stop();
    logging::info("Main") << "Bridge shutdown complete";
    logging::close_file();
    return 0;
}
