#include "uh1_connection.h"
#include "include/errors.hpp"
#include "include/log.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

namespace hmbridge {

static speed_t baud_to_speed(uint32_t baud) {
  switch (baud) {
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    default: return B4800;
  }
}

static bool parse_socket_url(const std::string& url, std::string& host, uint16_t& port) {
  std::string rest = url;
  const std::string scheme = "socket://";
  if (rest.compare(0, scheme.size(), scheme) == 0) rest = rest.substr(scheme.size());
  const size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) return false;
  char* end = nullptr;
  const unsigned long p = std::strtoul(rest.c_str() + colon + 1, &end, 10);
  if (*end != '\0' || p == 0 || p > 65535) return false;
  host = rest.substr(0, colon);
  port = (uint16_t)p;
  return true;
}

Uh1Connection::Uh1Connection(ConnectionConfig cfg) : cfg_(std::move(cfg)) {
  if (!cfg_.device.empty()) {
    socket_mode_ = false;
  } else if (!cfg_.url.empty()) {
    if (!parse_socket_url(cfg_.url, host_, port_)) throw ConfigError("bad hub url: " + cfg_.url);
    socket_mode_ = true;
  } else if (!cfg_.host.empty() && cfg_.port != 0) {
    host_ = cfg_.host;
    port_ = cfg_.port;
    socket_mode_ = true;
  } else {
    throw ConfigError("hub needs either a device or an ip and port or a url");
  }
  logging::info("UH1") << "Selected mode: " << (socket_mode_ ? "socket" : "device");
}

Uh1Connection::~Uh1Connection() {
  close();
}

std::string Uh1Connection::describe() const {
  if (socket_mode_) return "socket://" + host_ + ":" + std::to_string(port_);
  return cfg_.device;
}

bool Uh1Connection::open() {
  if (fd_ >= 0) {
    logging::info("UH1") << "Attempting to open an already open link";
    return true;
  }
  const bool ok = socket_mode_ ? open_socket() : open_serial();
  if (ok) logging::info("UH1") << "Opened " << describe();
  return ok;
}

bool Uh1Connection::open_serial() {
  fd_ = ::open(cfg_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    logging::error("UH1") << "Cannot open " << cfg_.device << ": " << std::strerror(errno);
    return false;
  }

  termios tio{};
  if (::tcgetattr(fd_, &tio) != 0) {
    logging::error("UH1") << "tcgetattr failed on " << cfg_.device << ": " << std::strerror(errno);
    close();
    return false;
  }

  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cflag &= ~PARENB;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CSIZE;
  tio.c_cflag |= CS8;

  const speed_t spd = baud_to_speed(cfg_.baudrate);
  ::cfsetispeed(&tio, spd);
  ::cfsetospeed(&tio, spd);

  if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
    logging::error("UH1") << "tcsetattr failed on " << cfg_.device << ": " << std::strerror(errno);
    close();
    return false;
  }
  ::tcflush(fd_, TCIOFLUSH);
  return true;
}

bool Uh1Connection::open_socket() {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(port_);
  const int rc = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    logging::error("UH1") << "Cannot resolve " << host_ << ": " << ::gai_strerror(rc);
    return false;
  }

  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (fd_ < 0) {
    logging::error("UH1") << "Cannot connect to " << describe() << ": " << std::strerror(errno);
    return false;
  }
  int flags = ::fcntl(fd_, F_GETFL, 0);
  ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
  return true;
}

void Uh1Connection::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    logging::info("UH1") << "Closed " << describe();
  }
  fd_ = -1;
}

void Uh1Connection::wait_ready(short events, int timeout_ms, const char* what) {
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = events;
  while (true) {
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc > 0) {
      if (pfd.revents & (POLLERR | POLLNVAL)) {
        throw TransientTransportError(std::string(what) + " failed: link error");
      }
      return;
    }
    if (rc == 0) throw TransientTransportError(std::string(what) + " timed out");
    if (errno != EINTR) throw TransientTransportError(std::string(what) + " failed: " + std::strerror(errno));
  }
}

void Uh1Connection::write(const std::vector<uint8_t>& bytes) {
  if (fd_ < 0) throw TransientTransportError("hub link is not open");
  const int timeout_ms = (int)cfg_.timeout.count();
  size_t sent = 0;
  while (sent < bytes.size()) {
    const ssize_t n = ::write(fd_, bytes.data() + sent, bytes.size() - sent);
    if (n > 0) {
      sent += (size_t)n;
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      wait_ready(POLLOUT, timeout_ms, "write");
      continue;
    }
    throw TransientTransportError(std::string("write failed: ") + std::strerror(errno));
  }
  if (!socket_mode_) ::tcdrain(fd_);
}

std::vector<uint8_t> Uh1Connection::read(size_t count) {
  if (fd_ < 0) throw TransientTransportError("hub link is not open");
  const int timeout_ms = (int)cfg_.timeout.count();
  std::vector<uint8_t> out(count);
  size_t got = 0;
  while (got < count) {
    wait_ready(POLLIN, timeout_ms, "read");
    const ssize_t n = ::read(fd_, out.data() + got, count - got);
    if (n > 0) {
      got += (size_t)n;
      continue;
    }
    if (n == 0) throw TransientTransportError("hub closed the link");
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
    throw TransientTransportError(std::string("read failed: ") + std::strerror(errno));
  }
  return out;
}

} // namespace hmbridge
