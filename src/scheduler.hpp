#pragma once
#include "include/hmbridge.hpp"
#include "poll_coalescer.hpp"
#include "task_queue.hpp"
#include "transport_arbiter.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace hmbridge {

struct SchedulerOptions {
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{300};
    // Pause after each task; throttles traffic on the hub, not needed for correctness.
    std::chrono::milliseconds command_pause{500};
    std::chrono::milliseconds poll_pause{250};
};

// Producer side is enqueue(); the single worker thread is the only caller of
// TransportArbiter::execute().
class Scheduler {
public:
    using PollSink = std::function<void(const PollSnapshot&)>;

    Scheduler(TransportArbiter& arbiter, PollCoalescer& coalescer,
              SchedulerOptions opts = SchedulerOptions());
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Never blocks. Returns the sequence number assigned to the task.
    uint64_t enqueue(Priority priority, Operation op, std::string description,
                     bool is_poll = false, Completion on_complete = nullptr);

    // Receives structured results of poll tasks. Set before start().
    void set_poll_sink(PollSink sink);

    void start();
    // Lets the in-flight task finish, then joins the worker. Queued tasks are dropped.
    void stop();

    size_t pending() const { return queue_.size(); }
    uint64_t completed() const { return completed_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    void loop();
    void run_task(Task& task);
    void pause(std::chrono::milliseconds d);

    TransportArbiter& arbiter_;
    PollCoalescer& coalescer_;
    SchedulerOptions opts_;
    PollSink poll_sink_;

    TaskQueue queue_;
    std::thread th_;
    std::atomic<bool> running_{false};
    std::mutex pause_mtx_;
    std::condition_variable pause_cv_;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace hmbridge
