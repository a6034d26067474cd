#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Heatmiser V3 framing as spoken through a UH1 hub.
//
// Request:  [addr, len, 0x81, func, start_lo, start_hi, n_lo, n_hi, payload..., crc_lo, crc_hi]
// Response: [0x81, len_lo, len_hi, addr, func, start_lo, start_hi, n_lo, n_hi, data..., crc_lo, crc_hi]
// A write is acknowledged with the short form [0x81, len_lo, len_hi, addr, 0x01, crc_lo, crc_hi].

namespace hmbridge {
namespace heatmiser {

static constexpr uint8_t  kMasterAddress = 0x81;
static constexpr uint8_t  kFuncRead      = 0x00;
static constexpr uint8_t  kFuncWrite     = 0x01;
static constexpr uint16_t kReadAll       = 0xFFFF;

static constexpr size_t kAckFrameLen      = 7;
static constexpr size_t kReadHeaderLen    = 9;
static constexpr size_t kMaxFrameLen      = 512;

// Write registers
static constexpr uint16_t kRegTargetTemp = 18;
static constexpr uint16_t kRegRunMode    = 23;
static constexpr uint16_t kRegHotWater   = 42;

// Offsets into the device control block returned by a full read
static constexpr size_t kDcbTargetTemp     = 18;
static constexpr size_t kDcbRunMode        = 23;
static constexpr size_t kDcbRemoteAirTemp  = 28;
static constexpr size_t kDcbFloorTemp      = 30;
static constexpr size_t kDcbAirTemp        = 32;
static constexpr size_t kDcbHeatingState   = 35;
static constexpr size_t kDcbHotWaterState  = 36;
static constexpr size_t kMinDcbLen         = 37;

static constexpr uint8_t kHotWaterWriteOn  = 1;
static constexpr uint8_t kHotWaterWriteOff = 2;

// CRC-16/CCITT, polynomial 0x1021, initial value 0xFFFF
uint16_t crc16(const uint8_t* data, size_t len);

std::vector<uint8_t> build_read_request(uint8_t address);
std::vector<uint8_t> build_write_request(uint8_t address, uint16_t reg, const std::vector<uint8_t>& payload);

struct Response {
  uint8_t source = 0;
  uint8_t function = 0;
  uint16_t start = 0;
  std::vector<uint8_t> data;
};

// Throws ProtocolError on wrong length, CRC, destination or source.
Response parse_response(const std::vector<uint8_t>& frame, uint8_t expected_source);

} // namespace heatmiser
} // namespace hmbridge
