#include "bridge.hpp"
#include "core/heatmiser/thermostat.h"
#include "include/log.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace hmbridge {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string upper(const std::string& s) {
    std::string out;
    for (char c : s) out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string lower(const std::string& s) {
    std::string out;
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Decimal string to whole degrees. Rejects empty, trailing junk and non-finite values.
bool parse_target(const std::string& payload, int& out) {
    if (payload.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(payload.c_str(), &end);
    if (end == payload.c_str() || *end != '\0' || !std::isfinite(v)) return false;
    if (v < -1000.0 || v > 1000.0) return false;
    out = static_cast<int>(std::lround(v));
    return true;
}

} // namespace

std::unique_ptr<DeviceLink> make_heatmiser_link(const ZoneConfig& zone, Connection& conn) {
    return std::make_unique<HeatmiserThermostat>(zone.id, zone.type, conn);
}

Bridge::Bridge(const BridgeConfig& cfg, std::unique_ptr<Connection> conn, MessageBus& bus,
               LinkFactory factory, BridgeOptions opts)
    : cfg_(cfg),
      opts_(opts),
      bus_(bus),
      arbiter_(std::move(conn), opts.reconnect_delay),
      scheduler_(arbiter_, coalescer_, opts.scheduler),
      publisher_(bus, cfg.bus.base_topic) {
    for (const auto& zc : cfg_.zones) {
        Zone zone;
        zone.cfg = zc;
        zone.link = factory(zc, arbiter_.connection());
        if (cfg_.hotwater.enabled && zc.id == cfg_.hotwater.zone_id) {
            logging::info("Bridge") << "Hot water control enabled on zone '" << zc.name << "'";
            hot_water_link_ = zone.link.get();
        }
        zones_.emplace(zc.name, std::move(zone));
    }
    scheduler_.set_poll_sink([this](const PollSnapshot& snapshot) {
        publisher_.publish_poll_results(snapshot);
    });
}

Bridge::~Bridge() {
    stop();
}

bool Bridge::start() {
    if (started_) return true;

    arbiter_.connect();
    scheduler_.start();

    bus_.set_message_handler([this](const std::string& topic, const std::string& payload) {
        on_message(topic, payload);
    });
    const std::string& base = cfg_.bus.base_topic;
    for (const auto& kv : zones_) bus_.subscribe(base + "/" + kv.first + "/set/#");
    if (hot_water_link_) bus_.subscribe(base + "/hotwater/set/#");

    if (!bus_.start()) {
        scheduler_.stop();
        arbiter_.close();
        return false;
    }
    started_ = true;
    publish_discovery();

    if (opts_.poll_timer) {
        std::lock_guard<std::mutex> lk(timer_mtx_);
        timer_running_ = true;
        timer_ = std::thread(&Bridge::timer_loop, this);
    }
    logging::info("Bridge") << "Started with " << zones_.size() << " zones, poll interval "
                            << cfg_.poll_interval.count() << "s";
    return true;
}

void Bridge::stop() {
    {
        std::lock_guard<std::mutex> lk(timer_mtx_);
        timer_running_ = false;
    }
    timer_cv_.notify_all();
    if (timer_.joinable()) timer_.join();

    if (!started_) return;
    started_ = false;
    // The worker publishes from completion callbacks; drain it before the bus goes.
    scheduler_.stop();
    bus_.stop();
    arbiter_.close();
    logging::info("Bridge") << "Stopped";
}

void Bridge::on_message(const std::string& topic, const std::string& raw) {
    const std::string payload = trim(raw);
    logging::info("Bridge") << "RX: " << topic << " => " << payload;

    const std::string& base = cfg_.bus.base_topic;
    const std::string hw_prefix = base + "/hotwater/set/";
    if (hot_water_link_ && starts_with(topic, hw_prefix)) {
        handle_hot_water(topic.substr(hw_prefix.size()), payload);
        return;
    }

    for (const auto& kv : zones_) {
        const std::string prefix = base + "/" + kv.first + "/set/";
        if (!starts_with(topic, prefix)) continue;
        const std::string attribute = topic.substr(prefix.size());
        if (attribute == "target") {
            handle_target(kv.second, payload);
        } else if (attribute == "mode") {
            handle_mode(kv.second, payload);
        } else {
            logging::debug("Bridge") << "Ignoring unknown attribute '" << attribute << "' for " << kv.first;
        }
        return;
    }
    logging::debug("Bridge") << "No handler for " << topic;
}

void Bridge::handle_target(const Zone& zone, const std::string& payload) {
    int value = 0;
    if (!parse_target(payload, value)) {
        logging::warning("Bridge") << "Invalid target temp for " << zone.cfg.name << ": " << payload;
        return;
    }
    DeviceLink* link = zone.link.get();
    const std::string name = zone.cfg.name;
    const SensorKind sensor = zone.cfg.sensor;
    ZoneOverrides overrides;
    overrides.has_target = true;
    overrides.target = value;

    scheduler_.enqueue(
        Priority::Command,
        [link, value]() {
            link->set_target_temp(value);
            link->read_state();
            return TaskResult();
        },
        name + " set target " + std::to_string(value) + "C", false,
        [this, link, name, sensor, overrides](const TaskResult&) {
            publisher_.publish_immediate(name, *link, sensor, overrides);
        });
}

void Bridge::handle_mode(const Zone& zone, const std::string& payload) {
    const bool frost = upper(payload) == "OFF";
    DeviceLink* link = zone.link.get();
    const std::string name = zone.cfg.name;
    const SensorKind sensor = zone.cfg.sensor;
    ZoneOverrides overrides;
    overrides.has_mode = true;
    overrides.mode = mode_label(frost ? RunMode::Frost : RunMode::Normal);

    scheduler_.enqueue(
        Priority::Command,
        [link, frost]() {
            link->set_frost_protect_mode(frost);
            link->read_state();
            return TaskResult();
        },
        name + " set mode " + overrides.mode, false,
        [this, link, name, sensor, overrides](const TaskResult&) {
            publisher_.publish_immediate(name, *link, sensor, overrides);
        });
}

void Bridge::handle_hot_water(const std::string& attribute, const std::string& payload) {
    if (attribute != "hw_state") {
        logging::debug("Bridge") << "Ignoring hot water attribute '" << attribute << "'";
        return;
    }
    const std::string cmd = upper(payload);
    HotWaterState state;
    if (cmd == "ON") {
        state = HotWaterState::On;
    } else if (cmd == "OFF") {
        state = HotWaterState::Off;
    } else {
        logging::warning("Bridge") << "Invalid hotwater payload: " << payload;
        return;
    }
    DeviceLink* link = hot_water_link_;
    scheduler_.enqueue(
        Priority::Command,
        [link, state]() {
            link->set_hot_water_state(state);
            return TaskResult();
        },
        std::string("HotWater ") + to_string(state), false,
        [this, cmd](const TaskResult&) { publisher_.publish_hot_water(cmd); });
}

bool Bridge::request_poll() {
    if (!coalescer_.try_start_poll()) {
        logging::debug("Bridge") << "Poll already pending; not queueing another";
        return false;
    }
    scheduler_.enqueue(Priority::Poll, [this]() { return poll_all(); }, "Poll all thermostats", true);
    return true;
}

TaskResult Bridge::poll_all() {
    TaskResult result;
    result.structured = true;
    for (auto& kv : zones_) {
        DeviceLink& link = *kv.second.link;
        link.read_state();
        result.snapshot.zones[kv.first] = read_zone_state(link, kv.second.cfg.sensor);
        if (opts_.zone_delay.count() > 0) std::this_thread::sleep_for(opts_.zone_delay);
    }
    if (hot_water_link_) {
        result.snapshot.has_hot_water = true;
        result.snapshot.hot_water_state = to_string(hot_water_link_->hot_water_state());
    }
    return result;
}

void Bridge::publish_discovery() {
    using nlohmann::json;
    const std::string& base = cfg_.bus.base_topic;
    const std::string& prefix = cfg_.bus.discovery_prefix;

    for (const auto& kv : zones_) {
        const std::string& name = kv.first;
        const ZoneConfig& zc = kv.second.cfg;
        const std::string zone_base = base + "/" + name;

        std::string title = name;
        if (!title.empty()) title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));

        json climate;
        climate["name"] = title + " Thermostat";
        climate["unique_id"] = "heatmiser_" + std::to_string(zc.id) + "_climate";
        climate["current_temperature_topic"] = zone_base + "/state/temperature";
        climate["temperature_state_topic"] = zone_base + "/state/target";
        climate["temperature_command_topic"] = zone_base + "/set/target";
        climate["min_temp"] = 5;
        climate["max_temp"] = 30;
        climate["modes"] = json::array({"heat", "off"});
        climate["mode_state_topic"] = zone_base + "/state/mode";
        climate["mode_command_topic"] = zone_base + "/set/mode";
        climate["action_topic"] = zone_base + "/state/action";
        bus_.publish(prefix + "/climate/heatmiser_" + name + "/config", climate.dump(), true);
        logging::info("Bridge") << "Published discovery for zone " << name;

        if (lower(zc.type) == "prthw" && hot_water_link_) {
            json sw;
            sw["name"] = cfg_.hotwater.name;
            sw["unique_id"] = "heatmiser_" + std::to_string(zc.id) + "_hotwater";
            sw["command_topic"] = base + "/hotwater/set/hw_state";
            sw["state_topic"] = base + "/hotwater/state/hw_state";
            sw["payload_on"] = "ON";
            sw["payload_off"] = "OFF";
            sw["state_on"] = "ON";
            sw["state_off"] = "OFF";
            bus_.publish(prefix + "/switch/heatmiser_hotwater/config", sw.dump(), true);
            logging::info("Bridge") << "Published hot water discovery for " << name;
        }
    }
}

void Bridge::timer_loop() {
    auto last_depth_log = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lk(timer_mtx_);
    while (timer_running_) {
        lk.unlock();
        request_poll();
        const auto now = std::chrono::steady_clock::now();
        if (now - last_depth_log >= std::chrono::minutes(10)) {
            logging::debug("Bridge") << "Queue size: " << scheduler_.pending();
            last_depth_log = now;
        }
        lk.lock();
        timer_cv_.wait_for(lk, cfg_.poll_interval, [this]{ return !timer_running_; });
    }
}

} // namespace hmbridge
