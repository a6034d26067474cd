#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hmbridge {

// Byte link to the hub. Only the TransportArbiter opens, closes or re-opens it;
// device links perform I/O through it from inside arbiter operations.
class Connection {
public:
    virtual ~Connection() = default;

    // Returns false and leaves the link closed when the hub cannot be reached.
    virtual bool open() = 0;
    virtual void close() noexcept = 0;
    virtual bool is_open() const = 0;

    // Both throw TransientTransportError on timeout, I/O error, or a closed link.
    virtual void write(const std::vector<uint8_t>& bytes) = 0;
    virtual std::vector<uint8_t> read(size_t count) = 0;

    virtual std::string describe() const = 0;
};

} // namespace hmbridge
