#pragma once
#include "core/bus/mqtt_bus.h"
#include "core/transport/uh1_connection.h"
#include "include/hmbridge.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hmbridge {

struct ZoneConfig {
    std::string name;
    uint8_t id = 0;
    std::string type = "prt";
    SensorKind sensor = SensorKind::Air;
};

struct HotWaterConfig {
    bool enabled = false;
    uint8_t zone_id = 0;
    std::string name = "Hot Water";
};

struct BusConfig {
    MqttConfig client;
    std::string base_topic = "home/heatmiser";
    std::string discovery_prefix = "homeassistant";
};

struct BridgeConfig {
    std::string log_level = "INFO";
    std::string log_file;
    BusConfig bus;
    ConnectionConfig hub;
    std::chrono::seconds poll_interval{120};
    std::vector<ZoneConfig> zones;
    HotWaterConfig hotwater;
};

// Both throw ConfigError with a message naming the offending key.
BridgeConfig parse_config(const std::string& json_text);
BridgeConfig load_config(const std::string& path);

} // namespace hmbridge
