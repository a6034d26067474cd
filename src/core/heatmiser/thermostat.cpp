#include "thermostat.h"
#include "include/errors.hpp"
#include "include/log.hpp"
#include <cctype>

namespace hmbridge {

using namespace heatmiser;

HeatmiserThermostat::HeatmiserThermostat(uint8_t address, std::string model, Connection& conn)
  : address_(address), conn_(conn) {
  for (char c : model) model_ += (char)std::tolower((unsigned char)c);
}

Response HeatmiserThermostat::exchange(const std::vector<uint8_t>& request) {
  conn_.write(request);
  std::vector<uint8_t> frame = conn_.read(3);
  const size_t len = (size_t)frame[1] | ((size_t)frame[2] << 8);
  if (len < kAckFrameLen || len > kMaxFrameLen) {
    throw ProtocolError("implausible frame length " + std::to_string(len));
  }
  std::vector<uint8_t> rest = conn_.read(len - 3);
  frame.insert(frame.end(), rest.begin(), rest.end());
  return parse_response(frame, address_);
}

void HeatmiserThermostat::read_state() {
  Response r = exchange(build_read_request(address_));
  if (r.function != kFuncRead) throw ProtocolError("unexpected reply to read");
  if (r.data.size() < kMinDcbLen) {
    throw ProtocolError("device control block too short (" + std::to_string(r.data.size()) + " bytes)");
  }
  dcb_ = std::move(r.data);
  logging::debug("Thermostat") << "Read " << dcb_.size() << " byte DCB from address " << (int)address_;
}

void HeatmiserThermostat::write_register(uint16_t reg, uint8_t value) {
  Response r = exchange(build_write_request(address_, reg, {value}));
  if (r.function != kFuncWrite) throw ProtocolError("unexpected reply to write");
}

uint8_t HeatmiserThermostat::byte_at(size_t offset) const {
  if (offset >= dcb_.size()) {
    throw ProtocolError("no state read yet for address " + std::to_string(address_));
  }
  return dcb_[offset];
}

double HeatmiserThermostat::temp_at(size_t offset) const {
  const unsigned raw = ((unsigned)byte_at(offset) << 8) | byte_at(offset + 1);
  return raw / 10.0;
}

double HeatmiserThermostat::air_temp() const {
  // 0xFFFF marks a remote sensor that is not fitted
  if (byte_at(kDcbRemoteAirTemp) != 0xFF || byte_at(kDcbRemoteAirTemp + 1) != 0xFF) {
    return temp_at(kDcbRemoteAirTemp);
  }
  return temp_at(kDcbAirTemp);
}

double HeatmiserThermostat::floor_temp() const {
  return temp_at(kDcbFloorTemp);
}

int HeatmiserThermostat::target_temp() const {
  return byte_at(kDcbTargetTemp);
}

void HeatmiserThermostat::set_target_temp(int celsius) {
  if (celsius < 5 || celsius > 35) {
    throw ProtocolError("target temperature " + std::to_string(celsius) + " out of range");
  }
  write_register(kRegTargetTemp, (uint8_t)celsius);
  if (dcb_.size() > kDcbTargetTemp) dcb_[kDcbTargetTemp] = (uint8_t)celsius;
}

RunMode HeatmiserThermostat::run_mode() const {
  return byte_at(kDcbRunMode) == 1 ? RunMode::Frost : RunMode::Normal;
}

void HeatmiserThermostat::set_frost_protect_mode(bool on) {
  write_register(kRegRunMode, on ? 1 : 0);
  if (dcb_.size() > kDcbRunMode) dcb_[kDcbRunMode] = on ? 1 : 0;
}

bool HeatmiserThermostat::heating_output_active() const {
  return byte_at(kDcbHeatingState) != 0;
}

HotWaterState HeatmiserThermostat::hot_water_state() const {
  if (model_ != "prthw") throw ProtocolError("model " + model_ + " has no hot water output");
  return byte_at(kDcbHotWaterState) != 0 ? HotWaterState::On : HotWaterState::Off;
}

void HeatmiserThermostat::set_hot_water_state(HotWaterState state) {
  if (model_ != "prthw") throw ProtocolError("model " + model_ + " has no hot water output");
  write_register(kRegHotWater, state == HotWaterState::On ? kHotWaterWriteOn : kHotWaterWriteOff);
  if (dcb_.size() > kDcbHotWaterState) dcb_[kDcbHotWaterState] = state == HotWaterState::On ? 1 : 0;
}

} // namespace hmbridge
