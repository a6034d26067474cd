#include "config.hpp"
#include "include/errors.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace hmbridge;

static bool rejects(const std::string& text) {
    try {
        parse_config(text);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

static void full_document() {
    const char* text = R"({
        "log_level": "DEBUG",
        "log_file": "logs/bridge.log",
        "mqtt": {"broker": "broker.local", "port": 8883, "username": "hass",
                 "password": "secret", "client_id": "hm-1", "keepalive": 30,
                 "base_topic": "home/hm", "discovery_prefix": "ha"},
        "heatmiser": {"ip": "10.0.0.5", "port": 1024, "baudrate": 9600,
                      "timeout_ms": 500, "poll_interval": 60},
        "zones": [
            {"name": "lounge", "id": 1, "type": "prt", "sensor_type": "air"},
            {"name": "bathroom", "id": 4, "type": "prthw", "sensor_type": "floor"}
        ],
        "hotwater": {"zone_id": 4, "name": "Cylinder"}
    })";
    BridgeConfig cfg = parse_config(text);
    assert(cfg.log_level == "DEBUG");
    assert(cfg.log_file == "logs/bridge.log");
    assert(cfg.bus.client.broker == "broker.local");
    assert(cfg.bus.client.port == 8883);
    assert(cfg.bus.client.username == "hass");
    assert(cfg.bus.client.password == "secret");
    assert(cfg.bus.client.client_id == "hm-1");
    assert(cfg.bus.client.keepalive == 30);
    assert(cfg.bus.base_topic == "home/hm");
    assert(cfg.bus.discovery_prefix == "ha");
    assert(cfg.hub.host == "10.0.0.5");
    assert(cfg.hub.port == 1024);
    assert(cfg.hub.baudrate == 9600);
    assert(cfg.hub.timeout.count() == 500);
    assert(cfg.poll_interval.count() == 60);
    assert(cfg.zones.size() == 2);
    assert(cfg.zones[1].name == "bathroom");
    assert(cfg.zones[1].id == 4);
    assert(cfg.zones[1].sensor == SensorKind::Floor);
    assert(cfg.hotwater.enabled);
    assert(cfg.hotwater.zone_id == 4);
    assert(cfg.hotwater.name == "Cylinder");
}

static void defaults() {
    BridgeConfig cfg = parse_config(R"({
        "mqtt": {"broker": "mqtt.local"},
        "heatmiser": {"device": "/dev/ttyUSB0"},
        "zones": [{"name": "hall", "id": 2}]
    })");
    assert(cfg.log_level == "INFO");
    assert(cfg.log_file.empty());
    assert(cfg.bus.client.broker == "mqtt.local");
    assert(cfg.bus.client.port == 1883);
    assert(cfg.bus.client.username.empty());
    assert(cfg.bus.client.keepalive == 60);
    assert(cfg.bus.base_topic == "home/heatmiser");
    assert(cfg.bus.discovery_prefix == "homeassistant");
    assert(cfg.hub.device == "/dev/ttyUSB0");
    assert(cfg.hub.baudrate == 4800);
    assert(cfg.hub.timeout.count() == 800);
    assert(cfg.poll_interval.count() == 120);
    assert(cfg.zones[0].type == "prt");
    assert(cfg.zones[0].sensor == SensorKind::Air);
    assert(!cfg.hotwater.enabled);
}

static void hot_water_on_unknown_zone_is_disabled() {
    BridgeConfig cfg = parse_config(R"({
        "mqtt": {"broker": "mqtt.local"},
        "heatmiser": {"url": "socket://hub:1024"},
        "zones": [{"name": "hall", "id": 2}],
        "hotwater": {"zone_id": 9}
    })");
    assert(!cfg.hotwater.enabled);
    assert(cfg.hub.url == "socket://hub:1024");
}

static void invalid_documents() {
    assert(rejects("not json"));
    assert(rejects("[]"));
    assert(rejects(R"({"heatmiser": {"device": "/dev/ttyUSB0"}, "zones": [{"name": "a", "id": 1}]})"));
    assert(rejects(R"({"mqtt": {"port": 1883}, "heatmiser": {"device": "/dev/ttyUSB0"},
                       "zones": [{"name": "a", "id": 1}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local", "port": 70000}, "heatmiser": {"device": "/dev/ttyUSB0"},
                       "zones": [{"name": "a", "id": 1}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "zones": [{"name": "a", "id": 1}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"ip": "10.0.0.5"}, "zones": [{"name": "a", "id": 1}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"}})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"}, "zones": []})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"}, "zones": [{"id": 1}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"}, "zones": [{"name": "a"}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"},
                       "zones": [{"name": "a", "id": 1}, {"name": "a", "id": 2}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"},
                       "zones": [{"name": "a", "id": 1, "sensor_type": "wall"}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0"},
                       "zones": [{"name": "a", "id": "one"}]})"));
    assert(rejects(R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyUSB0", "poll_interval": 0},
                       "zones": [{"name": "a", "id": 1}]})"));
}

static void load_from_file() {
    const std::string path = "test_config_options.json";
    {
        std::ofstream out(path);
        out << R"({"mqtt": {"broker": "mqtt.local"}, "heatmiser": {"device": "/dev/ttyS1"}, "zones": [{"name": "den", "id": 5}]})";
    }
    BridgeConfig cfg = load_config(path);
    assert(cfg.hub.device == "/dev/ttyS1");
    assert(cfg.zones[0].name == "den");
    std::remove(path.c_str());

    bool threw = false;
    try {
        load_config("does/not/exist.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    full_document();
    defaults();
    hot_water_on_unknown_zone_is_disabled();
    invalid_documents();
    load_from_file();
    std::cout << "Config test PASSED\n";
    return 0;
}
