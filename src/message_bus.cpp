#include "include/message_bus.hpp"
#include <vector>

namespace hmbridge {

namespace {

std::vector<std::string> split_levels(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find('/', start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

bool topic_matches(const std::string& filter, const std::string& topic) {
    const auto f = split_levels(filter);
    const auto t = split_levels(topic);
    for (size_t i = 0; i < f.size(); ++i) {
        if (f[i] == "#") return i + 1 == f.size();
        if (i >= t.size()) return false;
        if (f[i] != "+" && f[i] != t[i]) return false;
    }
    return f.size() == t.size();
}

} // namespace hmbridge
