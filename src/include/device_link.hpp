#pragma once
#include "hmbridge.hpp"

namespace hmbridge {

// Per-zone handle on one thermostat behind the hub.
// read_state() and the setters talk to the hub and may throw
// TransientTransportError or ProtocolError; getters decode the cached state.
class DeviceLink {
public:
    virtual ~DeviceLink() = default;

    virtual void read_state() = 0;

    virtual double air_temp() const = 0;
    virtual double floor_temp() const = 0;
    virtual int target_temp() const = 0;
    virtual void set_target_temp(int celsius) = 0;

    virtual RunMode run_mode() const = 0;
    virtual void set_frost_protect_mode(bool on) = 0;

    virtual bool heating_output_active() const = 0;

    virtual HotWaterState hot_water_state() const = 0;
    virtual void set_hot_water_state(HotWaterState state) = 0;
};

} // namespace hmbridge
