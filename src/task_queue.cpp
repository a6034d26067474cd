#include "task_queue.hpp"
#include <algorithm>

namespace hmbridge {

uint64_t TaskQueue::push(Task task) {
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        seq = next_seq_++;
        task.sequence = seq;
        heap_.push_back(std::move(task));
        std::push_heap(heap_.begin(), heap_.end(), Later());
    }
    cv_.notify_one();
    return seq;
}

void TaskQueue::pop_min_locked(Task& out) {
    std::pop_heap(heap_.begin(), heap_.end(), Later());
    out = std::move(heap_.back());
    heap_.pop_back();
}

bool TaskQueue::pop(Task& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&]{ return !heap_.empty() || closed_; });
    if (closed_) return false;
    pop_min_locked(out);
    return true;
}

bool TaskQueue::try_pop(Task& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_ || heap_.empty()) return false;
    pop_min_locked(out);
    return true;
}

void TaskQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::vector<Task> TaskQueue::drain() {
    std::vector<Task> out;
    std::lock_guard<std::mutex> lk(mtx_);
    while (!heap_.empty()) {
        Task t;
        pop_min_locked(t);
        out.push_back(std::move(t));
    }
    return out;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return heap_.size();
}

} // namespace hmbridge
