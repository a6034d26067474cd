#include "transport_arbiter.hpp"
#include "include/errors.hpp"
#include "include/log.hpp"
#include <thread>

namespace hmbridge {

TransportArbiter::TransportArbiter(std::unique_ptr<Connection> conn, std::chrono::milliseconds reconnect_delay)
    : conn_(std::move(conn)), reconnect_delay_(reconnect_delay) {}

TransportArbiter::~TransportArbiter() {
    close();
}

bool TransportArbiter::connect() {
    std::lock_guard<std::mutex> lk(io_mtx_);
    const bool ok = conn_->open();
    open_.store(ok, std::memory_order_release);
    if (ok) {
        logging::info("Arbiter") << "Connected to hub (" << conn_->describe() << ")";
    } else {
        logging::error("Arbiter") << "Could not open hub link (" << conn_->describe() << "); will retry on first command";
    }
    return ok;
}

TaskResult TransportArbiter::execute(const Operation& op, int max_retries, std::chrono::milliseconds retry_delay) {
    const int attempts = max_retries + 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        {
            std::lock_guard<std::mutex> lk(io_mtx_);
            try {
                return op();
            } catch (const TransientTransportError& e) {
                logging::warning("Arbiter") << "Hub command failed (" << e.what() << "), attempt "
                                            << attempt + 1 << "/" << attempts;
            }
        }
        std::this_thread::sleep_for(retry_delay);
    }

    // Lock released above; reconnect takes its own.
    if (!reconnect()) {
        throw TransportExhausted("hub unreachable after " + std::to_string(attempts) + " attempts and a failed reconnect");
    }

    {
        std::lock_guard<std::mutex> lk(io_mtx_);
        try {
            return op();
        } catch (const TransientTransportError& e) {
            logging::warning("Arbiter") << "Hub command failed after reconnect (" << e.what() << ")";
        }
    }
    throw TransportExhausted("hub unreachable after " + std::to_string(attempts) + " attempts and a reconnect");
}

bool TransportArbiter::reconnect() {
    std::lock_guard<std::mutex> lk(io_mtx_);
    conn_->close();
    open_.store(false, std::memory_order_release);
    std::this_thread::sleep_for(reconnect_delay_);
    const bool ok = conn_->open();
    open_.store(ok, std::memory_order_release);
    reconnects_.fetch_add(1, std::memory_order_relaxed);
    if (ok) {
        logging::info("Arbiter") << "Reconnected to hub (" << conn_->describe() << ")";
    } else {
        logging::error("Arbiter") << "Reconnect to hub failed (" << conn_->describe() << ")";
    }
    return ok;
}

void TransportArbiter::close() {
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (conn_->is_open()) {
        conn_->close();
        logging::info("Arbiter") << "Closed hub link";
    }
    open_.store(false, std::memory_order_release);
}

} // namespace hmbridge
