#pragma once
#include "include/connection.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace hmbridge {

// Captured once at startup and reused verbatim on every reconnect.
struct ConnectionConfig {
  std::string device;          // serial device, e.g. /dev/ttyUSB0
  std::string host;            // TCP mode: host and port of a serial server
  uint16_t port = 0;
  std::string url;             // socket://host:port, overrides host/port
  uint32_t baudrate = 4800;
  std::chrono::milliseconds timeout{800};
};

// Link to a UH1 hub, either over a local serial device (8N1, no flow
// control) or over TCP to a serial-to-network adapter.
class Uh1Connection : public Connection {
public:
  // Throws ConfigError when neither a device nor a socket target is given.
  explicit Uh1Connection(ConnectionConfig cfg);
  ~Uh1Connection() override;

  bool open() override;
  void close() noexcept override;
  bool is_open() const override { return fd_ >= 0; }

  void write(const std::vector<uint8_t>& bytes) override;
  std::vector<uint8_t> read(size_t count) override;

  std::string describe() const override;
  bool socket_mode() const { return socket_mode_; }

private:
  bool open_serial();
  bool open_socket();
  void wait_ready(short events, int timeout_ms, const char* what);

  ConnectionConfig cfg_;
  bool socket_mode_ = false;
  std::string host_;
  uint16_t port_ = 0;
  int fd_ = -1;
};

} // namespace hmbridge
