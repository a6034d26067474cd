#pragma once
#include <functional>
#include <string>

namespace hmbridge {

// Publish/subscribe client used by the bridge. Handlers run on the bus's own
// delivery thread.
class MessageBus {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

    virtual ~MessageBus() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;

    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void subscribe(const std::string& filter) = 0;
    virtual void publish(const std::string& topic, const std::string& payload, bool retain) = 0;
};

// MQTT-style filter match: '+' matches one level, a trailing '#' the rest.
bool topic_matches(const std::string& filter, const std::string& topic);

} // namespace hmbridge
