#pragma once
#include <stdexcept>

namespace hmbridge {

// Timeout or I/O failure on the hub link. The only error the arbiter retries.
class TransientTransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed frame, CRC mismatch, wrong responder, or any other device failure
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Retries and the follow-up reconnect are used up
class TransportExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hmbridge
