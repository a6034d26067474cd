#include "poll_coalescer.hpp"

namespace hmbridge {

bool PollCoalescer::try_start_poll() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (pending_) return false;
    pending_ = true;
    return true;
}

void PollCoalescer::mark_poll_finished() {
    std::lock_guard<std::mutex> lk(mtx_);
    pending_ = false;
}

bool PollCoalescer::poll_pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_;
}

} // namespace hmbridge
