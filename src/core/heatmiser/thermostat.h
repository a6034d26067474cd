#pragma once
#include "include/connection.hpp"
#include "include/device_link.hpp"
#include "protocol.h"
#include <cstdint>
#include <string>
#include <vector>

namespace hmbridge {

// Device link for one Heatmiser V3 thermostat. Keeps the last device control
// block read from the hub; getters decode it without touching the link.
// Only the worker thread uses an instance, so the cache is unguarded.
class HeatmiserThermostat : public DeviceLink {
public:
  HeatmiserThermostat(uint8_t address, std::string model, Connection& conn);

  void read_state() override;

  double air_temp() const override;
  double floor_temp() const override;
  int target_temp() const override;
  void set_target_temp(int celsius) override;

  RunMode run_mode() const override;
  void set_frost_protect_mode(bool on) override;

  bool heating_output_active() const override;

  HotWaterState hot_water_state() const override;
  void set_hot_water_state(HotWaterState state) override;

  uint8_t address() const { return address_; }
  const std::string& model() const { return model_; }
  bool has_state() const { return !dcb_.empty(); }

private:
  heatmiser::Response exchange(const std::vector<uint8_t>& request);
  void write_register(uint16_t reg, uint8_t value);
  uint8_t byte_at(size_t offset) const;
  double temp_at(size_t offset) const;

  uint8_t address_;
  std::string model_;
  Connection& conn_;
  std::vector<uint8_t> dcb_;
};

} // namespace hmbridge
