#include "protocol.h"
#include "include/errors.hpp"
#include <string>

namespace hmbridge {
namespace heatmiser {

uint16_t crc16(const uint8_t* data, size_t len) {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; i++) {
    crc ^= (uint16_t)data[i] << 8;
    for (int b = 0; b < 8; b++) {
      crc = (crc & 0x8000) ? (uint16_t)((crc << 1) ^ 0x1021) : (uint16_t)(crc << 1);
    }
  }
  return crc;
}

static void append_crc(std::vector<uint8_t>& frame) {
  const uint16_t crc = crc16(frame.data(), frame.size());
  frame.push_back((uint8_t)(crc & 0xFF));
  frame.push_back((uint8_t)(crc >> 8));
}

static std::vector<uint8_t> form_request(uint8_t address, uint8_t function, uint16_t start,
                                         uint16_t count, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> frame;
  frame.reserve(10 + payload.size());
  frame.push_back(address);
  frame.push_back((uint8_t)(10 + payload.size()));
  frame.push_back(kMasterAddress);
  frame.push_back(function);
  frame.push_back((uint8_t)(start & 0xFF));
  frame.push_back((uint8_t)(start >> 8));
  frame.push_back((uint8_t)(count & 0xFF));
  frame.push_back((uint8_t)(count >> 8));
  frame.insert(frame.end(), payload.begin(), payload.end());
  append_crc(frame);
  return frame;
}

std::vector<uint8_t> build_read_request(uint8_t address) {
  return form_request(address, kFuncRead, 0, kReadAll, {});
}

std::vector<uint8_t> build_write_request(uint8_t address, uint16_t reg, const std::vector<uint8_t>& payload) {
  if (payload.empty() || payload.size() > 200) throw ProtocolError("write payload size out of range");
  return form_request(address, kFuncWrite, reg, (uint16_t)payload.size(), payload);
}

Response parse_response(const std::vector<uint8_t>& frame, uint8_t expected_source) {
  if (frame.size() < kAckFrameLen) throw ProtocolError("short frame (" + std::to_string(frame.size()) + " bytes)");

  const size_t len = (size_t)frame[1] | ((size_t)frame[2] << 8);
  if (len != frame.size()) throw ProtocolError("frame length field mismatch");

  const uint16_t got_crc = (uint16_t)frame[len - 2] | ((uint16_t)frame[len - 1] << 8);
  if (got_crc != crc16(frame.data(), len - 2)) throw ProtocolError("CRC mismatch");

  if (frame[0] != kMasterAddress) throw ProtocolError("frame not addressed to master");
  if (frame[3] != expected_source) {
    throw ProtocolError("reply from address " + std::to_string(frame[3]) +
                        ", expected " + std::to_string(expected_source));
  }

  Response r;
  r.source = frame[3];
  r.function = frame[4];
  if (r.function == kFuncWrite && len == kAckFrameLen) return r;

  if (len < kReadHeaderLen + 2) throw ProtocolError("truncated read reply");
  r.start = (uint16_t)(frame[5] | (frame[6] << 8));
  const size_t count = (size_t)frame[7] | ((size_t)frame[8] << 8);
  if (kReadHeaderLen + count + 2 != len) throw ProtocolError("data length mismatch");
  r.data.assign(frame.begin() + kReadHeaderLen, frame.begin() + kReadHeaderLen + count);
  return r;
}

} // namespace heatmiser
} // namespace hmbridge
