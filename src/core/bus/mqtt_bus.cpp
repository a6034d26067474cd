#include "mqtt_bus.h"
#include "include/log.hpp"
#include <algorithm>
#include <mosquitto.h>
#include <mutex>
#include <stdexcept>

namespace hmbridge {

static std::once_flag g_lib_once;

MqttBus::MqttBus(MqttConfig cfg) : cfg_(std::move(cfg)) {
  std::call_once(g_lib_once, [] { mosquitto_lib_init(); });
  mosq_ = mosquitto_new(cfg_.client_id.empty() ? nullptr : cfg_.client_id.c_str(), true, this);
  if (!mosq_) throw std::runtime_error("mosquitto_new failed");
  mosquitto_connect_callback_set(mosq_, &MqttBus::on_connect_cb);
  mosquitto_disconnect_callback_set(mosq_, &MqttBus::on_disconnect_cb);
  mosquitto_message_callback_set(mosq_, &MqttBus::on_message_cb);
}

MqttBus::~MqttBus() {
  stop();
  mosquitto_destroy(mosq_);
}

bool MqttBus::start() {
  if (running_.load()) return true;

  if (!cfg_.username.empty()) {
    const int rc = mosquitto_username_pw_set(mosq_, cfg_.username.c_str(),
                                             cfg_.password.empty() ? nullptr : cfg_.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS) {
      logging::error("MQTT") << "Cannot set credentials: " << mosquitto_strerror(rc);
      return false;
    }
  }
  mosquitto_reconnect_delay_set(mosq_, 1, 30, true);

  int rc = mosquitto_connect_async(mosq_, cfg_.broker.c_str(), cfg_.port, cfg_.keepalive);
  if (rc != MOSQ_ERR_SUCCESS) {
    logging::error("MQTT") << "Cannot connect to " << cfg_.broker << ":" << cfg_.port << ": " << mosquitto_strerror(rc);
    return false;
  }
  rc = mosquitto_loop_start(mosq_);
  if (rc != MOSQ_ERR_SUCCESS) {
    logging::error("MQTT") << "Cannot start network loop: " << mosquitto_strerror(rc);
    mosquitto_disconnect(mosq_);
    return false;
  }
  running_.store(true);
  logging::info("MQTT") << "Connecting to " << cfg_.broker << ":" << cfg_.port;
  return true;
}

void MqttBus::stop() {
  if (!running_.exchange(false)) return;
  mosquitto_disconnect(mosq_);
  mosquitto_loop_stop(mosq_, false);
  connected_.store(false);
  logging::info("MQTT") << "Disconnected";
}

void MqttBus::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lk(mtx_);
  handler_ = std::move(handler);
}

void MqttBus::subscribe(const std::string& filter) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (std::find(filters_.begin(), filters_.end(), filter) != filters_.end()) return;
    filters_.push_back(filter);
  }
  // Otherwise sent by handle_connect().
  if (!connected_.load()) return;
  const int rc = send_subscribe(filter);
  if (rc != MOSQ_ERR_SUCCESS) {
    logging::warning("MQTT") << "Subscribe " << filter << " failed: " << mosquitto_strerror(rc);
  }
}

void MqttBus::publish(const std::string& topic, const std::string& payload, bool retain) {
  const int rc = send_publish(topic, payload, retain);
  if (rc != MOSQ_ERR_SUCCESS) {
    logging::warning("MQTT") << "Publish to " << topic << " failed: " << mosquitto_strerror(rc);
  }
}

void MqttBus::handle_connect(int rc) {
  if (rc != 0) {
    logging::error("MQTT") << "Broker refused connection: " << mosquitto_connack_string(rc);
    return;
  }
  connected_.store(true);
  std::vector<std::string> filters;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    filters = filters_;
  }
  logging::info("MQTT") << "Connected (rc=" << rc << "). Subscribing to " << filters.size() << " filters";
  for (const auto& f : filters) {
    const int src = send_subscribe(f);
    if (src != MOSQ_ERR_SUCCESS) {
      logging::warning("MQTT") << "Subscribe " << f << " failed: " << mosquitto_strerror(src);
    }
  }
}

void MqttBus::handle_disconnect(int rc) {
  connected_.store(false);
  if (rc != 0) {
    logging::warning("MQTT") << "Connection lost (" << mosquitto_strerror(rc) << "), reconnecting";
  }
}

void MqttBus::handle_message(const std::string& topic, const std::string& payload) {
  MessageHandler handler;
  bool wanted = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& f : filters_) {
      if (topic_matches(f, topic)) { wanted = true; break; }
    }
    handler = handler_;
  }
  if (!wanted) {
    logging::debug("MQTT") << "Dropping message on unsubscribed topic " << topic;
    return;
  }
  if (handler) handler(topic, payload);
}

int MqttBus::send_subscribe(const std::string& filter) {
  return mosquitto_subscribe(mosq_, nullptr, filter.c_str(), 0);
}

int MqttBus::send_publish(const std::string& topic, const std::string& payload, bool retain) {
  return mosquitto_publish(mosq_, nullptr, topic.c_str(), (int)payload.size(), payload.data(), 0, retain);
}

void MqttBus::on_connect_cb(struct mosquitto*, void* self, int rc) {
  static_cast<MqttBus*>(self)->handle_connect(rc);
}

void MqttBus::on_disconnect_cb(struct mosquitto*, void* self, int rc) {
  static_cast<MqttBus*>(self)->handle_disconnect(rc);
}

void MqttBus::on_message_cb(struct mosquitto*, void* self, const struct mosquitto_message* msg) {
  const char* data = static_cast<const char*>(msg->payload);
  static_cast<MqttBus*>(self)->handle_message(msg->topic, std::string(data ? data : "", data ? (size_t)msg->payloadlen : 0));
}

} // namespace hmbridge
