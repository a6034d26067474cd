#pragma once
#include "config.hpp"
#include "include/connection.hpp"
#include "include/device_link.hpp"
#include "include/message_bus.hpp"
#include "poll_coalescer.hpp"
#include "scheduler.hpp"
#include "state_publisher.hpp"
#include "transport_arbiter.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hmbridge {

struct BridgeOptions {
    SchedulerOptions scheduler;
    std::chrono::milliseconds reconnect_delay{1000};
    // Pause between zones during a poll walk
    std::chrono::milliseconds zone_delay{50};
    bool poll_timer = true;
};

// Builds the device link for one zone on the shared hub connection.
using LinkFactory = std::function<std::unique_ptr<DeviceLink>(const ZoneConfig&, Connection&)>;

std::unique_ptr<DeviceLink> make_heatmiser_link(const ZoneConfig& zone, Connection& conn);

// Wires bus messages and the poll timer into the scheduler and routes
// results back out through the state publisher.
class Bridge {
public:
    Bridge(const BridgeConfig& cfg, std::unique_ptr<Connection> conn, MessageBus& bus,
           LinkFactory factory = make_heatmiser_link, BridgeOptions opts = BridgeOptions());
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Returns false when the bus cannot be started.
    bool start();
    void stop();

    // Bus delivery entry point.
    void on_message(const std::string& topic, const std::string& payload);

    // Enqueues a poll walk unless one is already pending.
    bool request_poll();

    void publish_discovery();

    Scheduler& scheduler() { return scheduler_; }
    TransportArbiter& arbiter() { return arbiter_; }
    const PollCoalescer& coalescer() const { return coalescer_; }
    bool hot_water_enabled() const { return hot_water_link_ != nullptr; }

private:
    struct Zone {
        ZoneConfig cfg;
        std::unique_ptr<DeviceLink> link;
    };

    void handle_target(const Zone& zone, const std::string& payload);
    void handle_mode(const Zone& zone, const std::string& payload);
    void handle_hot_water(const std::string& attribute, const std::string& payload);
    TaskResult poll_all();
    void timer_loop();

    BridgeConfig cfg_;
    BridgeOptions opts_;
    MessageBus& bus_;
    TransportArbiter arbiter_;
    PollCoalescer coalescer_;
    Scheduler scheduler_;
    StatePublisher publisher_;

    // Zone registry; fixed after construction
    std::map<std::string, Zone> zones_;
    DeviceLink* hot_water_link_ = nullptr;

    std::thread timer_;
    std::mutex timer_mtx_;
    std::condition_variable timer_cv_;
    bool timer_running_ = false;
    bool started_ = false;
};

} // namespace hmbridge
