#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace hmbridge {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

namespace logging {

using Sink = std::function<void(LogLevel, const std::string& component, const std::string& message)>;

// One log record. Formats into a local buffer and emits on destruction, so
// concurrent records never interleave.
class Line {
public:
    Line(LogLevel level, const char* component);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template<typename T>
    Line& operator<<(const T& value) {
        if (enabled_) os_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    bool enabled_;
    std::ostringstream os_;
};

inline Line debug(const char* component) { return Line(LogLevel::Debug, component); }
inline Line info(const char* component) { return Line(LogLevel::Info, component); }
inline Line warning(const char* component) { return Line(LogLevel::Warning, component); }
inline Line error(const char* component) { return Line(LogLevel::Error, component); }

void set_level(LogLevel level);
LogLevel level();
const char* level_name(LogLevel level);

// Case-insensitive. Unknown names map to Info and set *ok to false.
LogLevel parse_level(const std::string& name, bool* ok = nullptr);

// Mirrors records into `path`, rotating to path.1 .. path.N past max_bytes.
bool open_file(const std::string& path, size_t max_bytes = 1000000, int backup_count = 5);
void close_file();

// Receives every emitted record in addition to stdout. Pass nullptr to remove.
void set_sink(Sink sink);

} // namespace logging
} // namespace hmbridge
