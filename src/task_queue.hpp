#pragma once
#include "include/hmbridge.hpp"
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace hmbridge {

// Unbounded priority queue of tasks. Dequeue order is ascending
// (priority, sequence): commands always ahead of polls, FIFO within a class.
class TaskQueue {
public:
    TaskQueue() = default;

    // Stamps the next sequence number onto the task and returns it. Never blocks.
    uint64_t push(Task task);

    // Blocks until a task is available. Returns false once close() was called.
    bool pop(Task& out);
    bool try_pop(Task& out);

    // Wakes every waiter; later pop() calls return false.
    void close();

    // Removes and returns every queued task in dequeue order.
    std::vector<Task> drain();

    size_t size() const;

private:
    struct Later {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence > b.sequence;
        }
    };

    void pop_min_locked(Task& out);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<Task> heap_;
    uint64_t next_seq_ = 0;
    bool closed_ = false;
};

} // namespace hmbridge
