#include "config.hpp"
#include "include/errors.hpp"
#include "include/log.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace hmbridge {

namespace {

template<typename T>
T get_or(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
    }
}

uint16_t port_or(const json& obj, const char* key, uint16_t fallback) {
    const int v = get_or<int>(obj, key, fallback);
    if (v < 0 || v > 65535) throw ConfigError(std::string("'") + key + "' is not a valid port");
    return static_cast<uint16_t>(v);
}

ZoneConfig parse_zone(const json& z) {
    if (!z.is_object()) throw ConfigError("zone entries must be objects");
    ZoneConfig zone;
    zone.name = get_or<std::string>(z, "name", "");
    if (zone.name.empty()) throw ConfigError("zone without 'name'");
    if (!z.contains("id")) throw ConfigError("zone '" + zone.name + "' has no 'id'");
    const int id = get_or<int>(z, "id", 0);
    if (id < 1 || id > 32) throw ConfigError("zone '" + zone.name + "' id out of range 1..32");
    zone.id = static_cast<uint8_t>(id);
    zone.type = get_or<std::string>(z, "type", "prt");

    const std::string sensor = get_or<std::string>(z, "sensor_type", "air");
    if (sensor == "air") {
        zone.sensor = SensorKind::Air;
    } else if (sensor == "floor") {
        zone.sensor = SensorKind::Floor;
    } else {
        throw ConfigError("zone '" + zone.name + "' has unknown sensor_type '" + sensor + "'");
    }
    return zone;
}

} // namespace

BridgeConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError("configuration root must be an object");

    BridgeConfig cfg;
    cfg.log_level = get_or<std::string>(root, "log_level", cfg.log_level);
    cfg.log_file = get_or<std::string>(root, "log_file", "");

    if (!root.contains("mqtt") || !root["mqtt"].is_object()) throw ConfigError("missing 'mqtt' section");
    const json& mqtt = root["mqtt"];
    cfg.bus.client.broker = get_or<std::string>(mqtt, "broker", "");
    if (cfg.bus.client.broker.empty()) throw ConfigError("'mqtt' needs 'broker'");
    cfg.bus.client.port = port_or(mqtt, "port", cfg.bus.client.port);
    if (cfg.bus.client.port == 0) throw ConfigError("'mqtt.port' must not be 0");
    cfg.bus.client.username = get_or<std::string>(mqtt, "username", "");
    cfg.bus.client.password = get_or<std::string>(mqtt, "password", "");
    cfg.bus.client.client_id = get_or<std::string>(mqtt, "client_id", "");
    cfg.bus.client.keepalive = get_or<int>(mqtt, "keepalive", cfg.bus.client.keepalive);
    if (cfg.bus.client.keepalive < 5) throw ConfigError("'mqtt.keepalive' must be at least 5 seconds");
    cfg.bus.base_topic = get_or<std::string>(mqtt, "base_topic", cfg.bus.base_topic);
    cfg.bus.discovery_prefix = get_or<std::string>(mqtt, "discovery_prefix", cfg.bus.discovery_prefix);

    if (!root.contains("heatmiser") || !root["heatmiser"].is_object()) {
        throw ConfigError("missing 'heatmiser' section");
    }
    const json& hm = root["heatmiser"];
    cfg.hub.device = get_or<std::string>(hm, "device", "");
    cfg.hub.host = get_or<std::string>(hm, "ip", "");
    cfg.hub.port = port_or(hm, "port", 0);
    cfg.hub.url = get_or<std::string>(hm, "url", "");
    cfg.hub.baudrate = get_or<uint32_t>(hm, "baudrate", cfg.hub.baudrate);
    cfg.hub.timeout = std::chrono::milliseconds(get_or<int>(hm, "timeout_ms", 800));
    if (cfg.hub.device.empty() && cfg.hub.url.empty() && (cfg.hub.host.empty() || cfg.hub.port == 0)) {
        throw ConfigError("'heatmiser' needs 'device', or 'ip' and 'port', or 'url'");
    }
    const int interval = get_or<int>(hm, "poll_interval", 120);
    if (interval <= 0) throw ConfigError("'poll_interval' must be positive");
    cfg.poll_interval = std::chrono::seconds(interval);

    if (!root.contains("zones") || !root["zones"].is_array() || root["zones"].empty()) {
        throw ConfigError("'zones' must be a non-empty array");
    }
    std::set<std::string> names;
    for (const auto& z : root["zones"]) {
        ZoneConfig zone = parse_zone(z);
        if (!names.insert(zone.name).second) throw ConfigError("duplicate zone name '" + zone.name + "'");
        cfg.zones.push_back(zone);
    }

    const json hw = root.value("hotwater", json::object());
    if (hw.is_object() && hw.contains("zone_id")) {
        const int zid = get_or<int>(hw, "zone_id", 0);
        cfg.hotwater.name = get_or<std::string>(hw, "name", cfg.hotwater.name);
        bool found = false;
        for (const auto& zone : cfg.zones) {
            if (zone.id == zid) found = true;
        }
        if (found) {
            cfg.hotwater.enabled = true;
            cfg.hotwater.zone_id = static_cast<uint8_t>(zid);
        } else {
            logging::warning("Config") << "hotwater.zone_id " << zid << " matches no zone; hot water disabled";
        }
    }
    return cfg;
}

BridgeConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot read " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

} // namespace hmbridge
