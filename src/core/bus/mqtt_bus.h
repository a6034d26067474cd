#pragma once
#include "include/message_bus.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct mosquitto;

namespace hmbridge {

struct MqttConfig {
  std::string broker;
  uint16_t port = 1883;
  std::string username;        // empty: connect anonymously
  std::string password;
  std::string client_id;       // empty: broker-assigned
  int keepalive = 60;
};

// MessageBus on a libmosquitto client. The client runs its own network
// thread, reconnects on its own, and every filter passed to subscribe() is
// sent again after each successful CONNACK.
class MqttBus : public MessageBus {
public:
  explicit MqttBus(MqttConfig cfg);
  ~MqttBus() override;

  bool start() override;
  void stop() override;

  void set_message_handler(MessageHandler handler) override;
  void subscribe(const std::string& filter) override;
  void publish(const std::string& topic, const std::string& payload, bool retain) override;

  bool connected() const { return connected_.load(); }

  // Called on the network thread.
  void handle_connect(int rc);
  void handle_disconnect(int rc);
  void handle_message(const std::string& topic, const std::string& payload);

protected:
  // Return a MOSQ_ERR_* code.
  virtual int send_subscribe(const std::string& filter);
  virtual int send_publish(const std::string& topic, const std::string& payload, bool retain);

private:
  static void on_connect_cb(struct mosquitto* m, void* self, int rc);
  static void on_disconnect_cb(struct mosquitto* m, void* self, int rc);
  static void on_message_cb(struct mosquitto* m, void* self, const struct mosquitto_message* msg);

  MqttConfig cfg_;
  struct mosquitto* mosq_ = nullptr;
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};

  std::mutex mtx_;
  MessageHandler handler_;
  std::vector<std::string> filters_;
};

} // namespace hmbridge
