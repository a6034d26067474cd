#include "state_publisher.hpp"
#include "include/log.hpp"
#include <cmath>
#include <cstdio>

namespace hmbridge {

std::string mode_label(RunMode mode) {
    return mode == RunMode::Frost ? "off" : "heat";
}

std::string action_label(bool heating_output_active) {
    return heating_output_active ? "heating" : "idle";
}

double display_temperature(const DeviceLink& link, SensorKind sensor) {
    return sensor == SensorKind::Floor ? link.floor_temp() : link.air_temp();
}

ZoneState read_zone_state(const DeviceLink& link, SensorKind sensor) {
    ZoneState s;
    s.temperature = display_temperature(link, sensor);
    s.target = link.target_temp();
    s.mode = mode_label(link.run_mode());
    s.action = action_label(link.heating_output_active());
    return s;
}

std::string format_temperature(double celsius) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", std::round(celsius * 10.0) / 10.0);
    return buf;
}

StatePublisher::StatePublisher(MessageBus& bus, std::string base_topic)
    : bus_(bus), base_(std::move(base_topic)) {}

std::string StatePublisher::state_topic(const std::string& zone, const char* attribute) const {
    return base_ + "/" + zone + "/state/" + attribute;
}

void StatePublisher::publish_zone(const std::string& zone, const ZoneState& state) {
    bus_.publish(state_topic(zone, "temperature"), format_temperature(state.temperature), true);
    bus_.publish(state_topic(zone, "target"), std::to_string(state.target), true);
    bus_.publish(state_topic(zone, "mode"), state.mode, true);
    bus_.publish(state_topic(zone, "action"), state.action, true);
}

void StatePublisher::publish_immediate(const std::string& zone, const DeviceLink& link, SensorKind sensor,
                                       const ZoneOverrides& overrides) {
    ZoneState state = read_zone_state(link, sensor);
    if (overrides.has_target) state.target = overrides.target;
    if (overrides.has_mode) state.mode = overrides.mode;
    publish_zone(zone, state);
    logging::debug("Publisher") << "Immediate update for " << zone << " -> temp=" << format_temperature(state.temperature)
                                << " target=" << state.target << " mode=" << state.mode << " action=" << state.action;
}

void StatePublisher::publish_poll_results(const PollSnapshot& snapshot) {
    for (const auto& kv : snapshot.zones) {
        publish_zone(kv.first, kv.second);
        logging::debug("Publisher") << "Published polled state for " << kv.first;
    }
    if (snapshot.has_hot_water && !snapshot.hot_water_state.empty()) {
        publish_hot_water(snapshot.hot_water_state);
    }
}

void StatePublisher::publish_hot_water(const std::string& state) {
    bus_.publish(base_ + "/hotwater/state/hw_state", state, true);
    logging::debug("Publisher") << "Hot water state published: " << state;
}

} // namespace hmbridge
