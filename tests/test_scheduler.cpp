#include "fakes.hpp"
#include "scheduler.hpp"
#include <cassert>
#include <iostream>
#include <mutex>
#include <vector>

using namespace hmbridge;
using namespace hmbridge::testing;
using namespace std::chrono_literals;

struct Rig {
    FakeConnection* conn = new FakeConnection();
    TransportArbiter arbiter{std::unique_ptr<Connection>(conn), 0ms};
    PollCoalescer coalescer;
    Scheduler sched;

    static SchedulerOptions fast() {
        SchedulerOptions o;
        o.retry_delay = 0ms;
        o.command_pause = 0ms;
        o.poll_pause = 0ms;
        return o;
    }
    Rig() : sched(arbiter, coalescer, fast()) { assert(arbiter.connect()); }
};

// Enqueued before the worker starts, so the worker sees the whole mix at once.
static void worker_runs_commands_before_polls() {
    Rig rig;
    std::mutex mtx;
    std::vector<std::string> order;
    auto record = [&](const std::string& tag) {
        return [&mtx, &order, tag]() {
            std::lock_guard<std::mutex> lk(mtx);
            order.push_back(tag);
            return TaskResult();
        };
    };
    rig.sched.enqueue(Priority::Poll, record("p1"), "p1", true);
    rig.sched.enqueue(Priority::Command, record("c1"), "c1");
    rig.sched.enqueue(Priority::Poll, record("p2"), "p2", true);
    rig.sched.enqueue(Priority::Command, record("c2"), "c2");
    rig.sched.enqueue(Priority::Command, record("c3"), "c3");
    rig.sched.start();

    assert(wait_until([&]{ return rig.sched.completed() == 5; }));
    rig.sched.stop();
    const std::vector<std::string> expected{"c1", "c2", "c3", "p1", "p2"};
    assert(order == expected);
}

// A failing task is logged and dropped; the next task still runs.
static void failing_task_does_not_stall_worker() {
    Rig rig;
    LogCapture logs;
    rig.sched.start();
    rig.sched.enqueue(Priority::Command, []() -> TaskResult { throw ProtocolError("bad reply"); }, "broken");
    rig.sched.enqueue(Priority::Command, []() -> TaskResult { throw TransientTransportError("timeout"); }, "flaky");
    std::atomic<bool> ran{false};
    rig.sched.enqueue(Priority::Command, [&]() { ran = true; return TaskResult(); }, "healthy");

    assert(wait_until([&]{ return ran.load(); }));
    rig.sched.stop();
    assert(rig.sched.failed() == 2);
    assert(rig.sched.completed() == 1);
    assert(logs.count(LogLevel::Error, "Scheduler") == 2);
}

// Persistent transient failure exhausts the arbiter; the loop keeps going.
static void exhausted_task_is_discarded() {
    Rig rig;
    std::atomic<int> attempts{0};
    std::atomic<bool> callback_ran{false};
    rig.sched.start();
    rig.sched.enqueue(Priority::Command, [&]() -> TaskResult {
        attempts.fetch_add(1);
        throw TransientTransportError("timeout");
    }, "dead hub", false, [&](const TaskResult&) { callback_ran = true; });
    std::atomic<bool> next{false};
    rig.sched.enqueue(Priority::Command, [&]() { next = true; return TaskResult(); }, "next");

    assert(wait_until([&]{ return next.load(); }));
    rig.sched.stop();
    assert(attempts.load() == 4);
    assert(!callback_ran.load());
    assert(rig.arbiter.reconnect_count() == 1);
}

static void callback_failure_is_isolated() {
    Rig rig;
    LogCapture logs;
    std::atomic<int> callbacks{0};
    rig.sched.start();
    rig.sched.enqueue(Priority::Command, []() { return TaskResult(); }, "cmd", false,
                      [&](const TaskResult&) {
                          callbacks.fetch_add(1);
                          throw std::runtime_error("publish failed");
                      });
    rig.sched.enqueue(Priority::Command, []() { return TaskResult(); }, "cmd2", false,
                      [&](const TaskResult&) { callbacks.fetch_add(1); });

    assert(wait_until([&]{ return callbacks.load() == 2; }));
    assert(wait_until([&]{ return rig.sched.completed() == 2; }));
    rig.sched.stop();
    assert(rig.sched.failed() == 0);
    assert(logs.count(LogLevel::Warning, "Scheduler") == 1);
}

static void poll_results_reach_sink() {
    Rig rig;
    std::mutex mtx;
    std::vector<PollSnapshot> seen;
    rig.sched.set_poll_sink([&](const PollSnapshot& s) {
        std::lock_guard<std::mutex> lk(mtx);
        seen.push_back(s);
    });
    rig.sched.start();

    assert(rig.coalescer.try_start_poll());
    rig.sched.enqueue(Priority::Poll, []() {
        TaskResult r;
        r.structured = true;
        r.snapshot.zones["lounge"].temperature = 19.5;
        return r;
    }, "poll", true);
    // Unstructured results from a command never reach the sink.
    rig.sched.enqueue(Priority::Command, []() { return TaskResult(); }, "cmd");

    assert(wait_until([&]{ return rig.sched.completed() == 2; }));
    assert(wait_until([&]{ return !rig.coalescer.poll_pending(); }));
    rig.sched.stop();
    std::lock_guard<std::mutex> lk(mtx);
    assert(seen.size() == 1);
    assert(seen[0].zones.at("lounge").temperature == 19.5);
}

static void stop_discards_queued_tasks() {
    Rig rig;
    std::atomic<int> ran{0};
    SchedulerOptions slow = Rig::fast();
    slow.command_pause = 200ms;
    Scheduler sched(rig.arbiter, rig.coalescer, slow);
    for (int i = 0; i < 5; ++i) {
        sched.enqueue(Priority::Command, [&]() { ran.fetch_add(1); return TaskResult(); }, "cmd");
    }
    assert(rig.coalescer.try_start_poll());
    sched.enqueue(Priority::Poll, [&]() { return TaskResult(); }, "poll", true);
    sched.start();
    assert(wait_until([&]{ return ran.load() >= 1; }));
    sched.stop();
    assert(ran.load() < 5);
    assert(sched.pending() == 0);
    assert(!rig.coalescer.poll_pending());
}

int main() {
    worker_runs_commands_before_polls();
    failing_task_does_not_stall_worker();
    exhausted_task_is_discarded();
    callback_failure_is_isolated();
    poll_results_reach_sink();
    stop_discards_queued_tasks();
    std::cout << "Scheduler test PASSED\n";
    return 0;
}
