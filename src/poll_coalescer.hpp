#pragma once
#include <mutex>

namespace hmbridge {

// Gate keeping at most one poll task enqueued or executing at any time.
// Its lock is independent of the task queue and of the transport.
class PollCoalescer {
public:
    // True when the caller won the slot and must enqueue exactly one poll task.
    bool try_start_poll();

    // Called once per executed poll task, whatever its outcome.
    void mark_poll_finished();

    bool poll_pending() const;

private:
    mutable std::mutex mtx_;
    bool pending_ = false;
};

} // namespace hmbridge
