#include "scheduler.hpp"
#include "include/log.hpp"
#include <exception>

namespace hmbridge {

Scheduler::Scheduler(TransportArbiter& arbiter, PollCoalescer& coalescer, SchedulerOptions opts)
    : arbiter_(arbiter), coalescer_(coalescer), opts_(opts) {}

Scheduler::~Scheduler() {
    stop();
}

uint64_t Scheduler::enqueue(Priority priority, Operation op, std::string description,
                            bool is_poll, Completion on_complete) {
    Task task;
    task.priority = priority;
    task.operation = std::move(op);
    task.description = std::move(description);
    task.is_poll = is_poll;
    task.on_complete = std::move(on_complete);
    return queue_.push(std::move(task));
}

void Scheduler::set_poll_sink(PollSink sink) {
    poll_sink_ = std::move(sink);
}

void Scheduler::start() {
    if (running_.exchange(true)) return;
    th_ = std::thread(&Scheduler::loop, this);
}

void Scheduler::stop() {
    if (!running_.exchange(false)) return;
    queue_.close();
    {
        std::lock_guard<std::mutex> lk(pause_mtx_);
    }
    pause_cv_.notify_all();
    if (th_.joinable()) th_.join();

    for (auto& task : queue_.drain()) {
        logging::info("Scheduler") << "Discarding queued task at shutdown: " << task.description;
        if (task.is_poll) coalescer_.mark_poll_finished();
    }
}

void Scheduler::pause(std::chrono::milliseconds d) {
    if (d.count() <= 0) return;
    std::unique_lock<std::mutex> lk(pause_mtx_);
    pause_cv_.wait_for(lk, d, [&]{ return !running_.load(); });
}

void Scheduler::loop() {
    while (running_.load()) {
        Task task;
        if (!queue_.pop(task)) return;
        run_task(task);
        pause(task.priority == Priority::Poll ? opts_.poll_pause : opts_.command_pause);
    }
}

void Scheduler::run_task(Task& task) {
    logging::debug("Scheduler") << "Executing task: " << task.description
                                << " [" << (task.is_poll ? "poll" : "command") << "] seq=" << task.sequence;
    try {
        TaskResult result = arbiter_.execute(task.operation, opts_.max_retries, opts_.retry_delay);
        if (task.on_complete) {
            try {
                task.on_complete(result);
            } catch (const std::exception& e) {
                logging::warning("Scheduler") << "Callback for " << task.description << " failed: " << e.what();
            }
        }
        if (task.is_poll && result.structured && poll_sink_) {
            poll_sink_(result.snapshot);
        }
        completed_.fetch_add(1);
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        logging::error("Scheduler") << "Task '" << task.description << "' failed: " << e.what();
    }
    if (task.is_poll) coalescer_.mark_poll_finished();
}

} // namespace hmbridge
