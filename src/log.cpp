#include "include/log.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace hmbridge {
namespace logging {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};

struct FileState {
    std::ofstream out;
    std::string path;
    size_t max_bytes = 0;
    int backup_count = 0;
    size_t written = 0;
};

std::mutex g_mtx;
FileState g_file;
Sink g_sink;

std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s,%03d", buf, static_cast<int>(ms));
    return out;
}

// Caller holds g_mtx.
void rotate_locked() {
    g_file.out.close();
    for (int i = g_file.backup_count - 1; i >= 1; --i) {
        const std::string from = g_file.path + "." + std::to_string(i);
        const std::string to = g_file.path + "." + std::to_string(i + 1);
        std::rename(from.c_str(), to.c_str());
    }
    if (g_file.backup_count > 0) {
        const std::string first = g_file.path + ".1";
        std::rename(g_file.path.c_str(), first.c_str());
    }
    g_file.out.open(g_file.path, std::ios::out | std::ios::trunc);
    g_file.written = 0;
}

} // namespace

Line::Line(LogLevel level, const char* component)
    : level_(level), component_(component),
      enabled_(static_cast<uint8_t>(level) >= g_level.load(std::memory_order_relaxed)) {}

Line::~Line() {
    if (!enabled_) return;
    const std::string message = os_.str();
    std::string line = timestamp();
    line += " [";
    line += level_name(level_);
    line += "] [";
    line += component_;
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lk(g_mtx);
    std::cout << line << std::flush;
    if (g_file.out.is_open()) {
        if (g_file.max_bytes > 0 && g_file.written + line.size() > g_file.max_bytes) rotate_locked();
        if (g_file.out.is_open()) {
            g_file.out << line << std::flush;
            g_file.written += line.size();
        }
    }
    if (g_sink) g_sink(level_, component_, message);
}

void set_level(LogLevel level) {
    g_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LogLevel parse_level(const std::string& name, bool* ok) {
    std::string upper;
    for (char c : name) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (ok) *ok = true;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    if (ok) *ok = false;
    return LogLevel::Info;
}

bool open_file(const std::string& path, size_t max_bytes, int backup_count) {
    std::lock_guard<std::mutex> lk(g_mtx);
    if (g_file.out.is_open()) g_file.out.close();
    g_file.out.open(path, std::ios::out | std::ios::app);
    if (!g_file.out.is_open()) return false;
    g_file.path = path;
    g_file.max_bytes = max_bytes;
    g_file.backup_count = backup_count;
    g_file.out.seekp(0, std::ios::end);
    const std::streamoff pos = g_file.out.tellp();
    g_file.written = pos > 0 ? static_cast<size_t>(pos) : 0;
    return true;
}

void close_file() {
    std::lock_guard<std::mutex> lk(g_mtx);
    if (g_file.out.is_open()) g_file.out.close();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(g_mtx);
    g_sink = std::move(sink);
}

} // namespace logging
} // namespace hmbridge
