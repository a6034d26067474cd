#pragma once
#include "include/connection.hpp"
#include "include/device_link.hpp"
#include "include/errors.hpp"
#include "include/log.hpp"
#include "include/message_bus.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hmbridge {
namespace testing {

// Polls `pred` until it holds or `timeout` passes.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Connection whose open() results and inbound bytes are scripted.
class FakeConnection : public Connection {
public:
    bool open() override {
        std::lock_guard<std::mutex> lk(mtx);
        ++open_calls;
        bool ok = default_open_result;
        if (!open_results.empty()) {
            ok = open_results.front();
            open_results.pop_front();
        }
        is_open_ = ok;
        return ok;
    }
    void close() noexcept override {
        std::lock_guard<std::mutex> lk(mtx);
        ++close_calls;
        is_open_ = false;
    }
    bool is_open() const override {
        std::lock_guard<std::mutex> lk(mtx);
        return is_open_;
    }
    void write(const std::vector<uint8_t>& bytes) override {
        std::lock_guard<std::mutex> lk(mtx);
        if (!is_open_) throw TransientTransportError("hub link is not open");
        written.push_back(bytes);
        if (!replies.empty()) {
            rx.insert(rx.end(), replies.front().begin(), replies.front().end());
            replies.pop_front();
        }
    }
    std::vector<uint8_t> read(size_t count) override {
        std::lock_guard<std::mutex> lk(mtx);
        if (!is_open_) throw TransientTransportError("hub link is not open");
        if (rx.size() < count) throw TransientTransportError("read timed out");
        std::vector<uint8_t> out(rx.begin(), rx.begin() + count);
        rx.erase(rx.begin(), rx.begin() + count);
        return out;
    }
    std::string describe() const override { return "fake"; }

    // Queues the frame the hub sends after the next write.
    void queue_reply(const std::vector<uint8_t>& frame) {
        std::lock_guard<std::mutex> lk(mtx);
        replies.push_back(frame);
    }

    mutable std::mutex mtx;
    bool is_open_ = false;
    bool default_open_result = true;
    std::deque<bool> open_results;
    int open_calls = 0;
    int close_calls = 0;
    std::vector<std::vector<uint8_t>> written;
    std::deque<std::vector<uint8_t>> replies;
    std::deque<uint8_t> rx;
};

// Device link backed by plain fields. Every call is counted.
class FakeLink : public DeviceLink {
public:
    void read_state() override {
        ++reads;
        if (fail_reads) throw TransientTransportError("fake read timeout");
    }
    double air_temp() const override { return air; }
    double floor_temp() const override { return floor; }
    int target_temp() const override { return target; }
    void set_target_temp(int celsius) override {
        ++writes;
        if (write_delay.count() > 0) std::this_thread::sleep_for(write_delay);
        target = celsius;
    }
    RunMode run_mode() const override { return mode; }
    void set_frost_protect_mode(bool on) override {
        ++writes;
        mode = on ? RunMode::Frost : RunMode::Normal;
    }
    bool heating_output_active() const override { return heating; }
    HotWaterState hot_water_state() const override { return hot_water; }
    void set_hot_water_state(HotWaterState s) override {
        ++writes;
        hot_water = s;
    }

    double air = 19.5;
    double floor = 23.0;
    int target = 20;
    RunMode mode = RunMode::Normal;
    bool heating = false;
    HotWaterState hot_water = HotWaterState::Off;
    bool fail_reads = false;
    std::chrono::milliseconds write_delay{0};
    std::atomic<int> reads{0};
    std::atomic<int> writes{0};
};

struct Published {
    std::string topic;
    std::string payload;
    bool retain;
};

class RecordingBus : public MessageBus {
public:
    bool start() override { started.store(true); return start_result; }
    void stop() override { started.store(false); }
    void set_message_handler(MessageHandler h) override { handler = std::move(h); }
    void subscribe(const std::string& filter) override {
        std::lock_guard<std::mutex> lk(mtx);
        filters.push_back(filter);
    }
    void publish(const std::string& topic, const std::string& payload, bool retain) override {
        std::lock_guard<std::mutex> lk(mtx);
        if (!started.load()) ++published_while_stopped;
        messages.push_back(Published{topic, payload, retain});
    }

    std::vector<Published> snapshot() const {
        std::lock_guard<std::mutex> lk(mtx);
        return messages;
    }
    std::vector<Published> with_prefix(const std::string& prefix) const {
        std::vector<Published> out;
        for (const auto& m : snapshot()) {
            if (m.topic.compare(0, prefix.size(), prefix) == 0) out.push_back(m);
        }
        return out;
    }
    size_t count_prefix(const std::string& prefix) const { return with_prefix(prefix).size(); }
    std::string last(const std::string& topic) const {
        std::string value;
        for (const auto& m : snapshot()) {
            if (m.topic == topic) value = m.payload;
        }
        return value;
    }
    void clear() {
        std::lock_guard<std::mutex> lk(mtx);
        messages.clear();
    }

    mutable std::mutex mtx;
    std::vector<Published> messages;
    std::vector<std::string> filters;
    MessageHandler handler;
    std::atomic<bool> started{false};
    int published_while_stopped = 0;
    bool start_result = true;
};

// Collects log records for the lifetime of the object.
class LogCapture {
public:
    LogCapture() {
        logging::set_sink([this](LogLevel level, const std::string& component, const std::string& message) {
            std::lock_guard<std::mutex> lk(mtx_);
            records_.push_back(Record{level, component, message});
        });
    }
    ~LogCapture() { logging::set_sink(nullptr); }

    size_t count(LogLevel level, const std::string& component = "") const {
        std::lock_guard<std::mutex> lk(mtx_);
        size_t n = 0;
        for (const auto& r : records_) {
            if (r.level == level && (component.empty() || r.component == component)) ++n;
        }
        return n;
    }

private:
    struct Record {
        LogLevel level;
        std::string component;
        std::string message;
    };
    mutable std::mutex mtx_;
    std::vector<Record> records_;
};

} // namespace testing
} // namespace hmbridge
