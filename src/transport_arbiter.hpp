#pragma once
#include "include/connection.hpp"
#include "include/hmbridge.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace hmbridge {

// Sole owner of the hub connection. Every device exchange runs through
// execute(), one at a time, under the transport lock.
class TransportArbiter {
public:
    explicit TransportArbiter(std::unique_ptr<Connection> conn,
                              std::chrono::milliseconds reconnect_delay = std::chrono::milliseconds(1000));
    ~TransportArbiter();

    TransportArbiter(const TransportArbiter&) = delete;
    TransportArbiter& operator=(const TransportArbiter&) = delete;

    // Initial open. A failure is logged; the first execute() will reconnect.
    bool connect();

    // Runs `op` under the transport lock. TransientTransportError is retried
    // up to max_retries times with retry_delay between attempts (slept outside
    // the lock); after that the link is re-established and `op` gets one last
    // attempt. Any other exception propagates on first occurrence.
    // Throws TransportExhausted when the retries and the reconnect are used up.
    TaskResult execute(const Operation& op, int max_retries, std::chrono::milliseconds retry_delay);

    // Closes and re-opens the link with its original settings. Takes the
    // transport lock itself, so it must never be called from inside an operation.
    bool reconnect();

    void close();

    // For binding device links at startup. Do not perform I/O outside execute().
    Connection& connection() { return *conn_; }

    bool is_open() const { return open_.load(std::memory_order_acquire); }
    uint64_t reconnect_count() const { return reconnects_.load(std::memory_order_relaxed); }

private:
    std::unique_ptr<Connection> conn_;
    std::chrono::milliseconds reconnect_delay_;
    std::mutex io_mtx_;
    std::atomic<bool> open_{false};
    std::atomic<uint64_t> reconnects_{0};
};

} // namespace hmbridge
