#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace hmbridge {

// Scheduling class of a task. Lower value is dequeued first.
enum class Priority : uint8_t {
    Command = 0,
    Poll = 1,
};

enum class RunMode : uint8_t {
    Normal = 0,
    Frost = 1,
};

enum class HotWaterState : uint8_t {
    On,
    Off,
};

// Which sensor a zone reports as its current temperature
enum class SensorKind : uint8_t {
    Air,
    Floor,
};

// Attributes published for one zone
struct ZoneState {
    double temperature = 0.0;
    int target = 0;
    std::string mode;
    std::string action;
};

// Outcome of a full refresh walk over every zone
struct PollSnapshot {
    std::map<std::string, ZoneState> zones;
    bool has_hot_water = false;
    std::string hot_water_state;
};

// Value an operation hands back to the worker. Only poll walks are structured.
struct TaskResult {
    bool structured = false;
    PollSnapshot snapshot;
};

using Operation = std::function<TaskResult()>;
using Completion = std::function<void(const TaskResult&)>;

// Task: one unit of work, executed once by the worker and then dropped
struct Task {
    Priority priority = Priority::Command;
    uint64_t sequence = 0;
    Operation operation;
    std::string description;
    bool is_poll = false;
    Completion on_complete;
};

inline const char* to_string(HotWaterState s) {
    return s == HotWaterState::On ? "ON" : "OFF";
}

} // namespace hmbridge
