#pragma once
#include "include/device_link.hpp"
#include "include/hmbridge.hpp"
#include "include/message_bus.hpp"
#include <string>

namespace hmbridge {

// Attribute values a command asserts before the hub confirms them. Captured
// by value when the command is enqueued.
struct ZoneOverrides {
    bool has_target = false;
    int target = 0;
    bool has_mode = false;
    std::string mode;
};

std::string mode_label(RunMode mode);
std::string action_label(bool heating_output_active);
double display_temperature(const DeviceLink& link, SensorKind sensor);

// Current attributes of one zone, decoded from the link's cached state.
ZoneState read_zone_state(const DeviceLink& link, SensorKind sensor);

std::string format_temperature(double celsius);

// Turns task results into retained state messages under <base>/<zone>/state/.
class StatePublisher {
public:
    StatePublisher(MessageBus& bus, std::string base_topic);

    void publish_zone(const std::string& zone, const ZoneState& state);

    // Immediate path: overrides merged over the zone's freshly read attributes.
    void publish_immediate(const std::string& zone, const DeviceLink& link, SensorKind sensor,
                           const ZoneOverrides& overrides);

    // Batch path for a poll walk.
    void publish_poll_results(const PollSnapshot& snapshot);

    void publish_hot_water(const std::string& state);

    std::string state_topic(const std::string& zone, const char* attribute) const;
    const std::string& base_topic() const { return base_; }

private:
    MessageBus& bus_;
    std::string base_;
};

} // namespace hmbridge
