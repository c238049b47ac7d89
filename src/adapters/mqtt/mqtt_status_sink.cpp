// File: src/adapters/mqtt/mqtt_status_sink.cpp
#include "ps/adapters/mqtt/mqtt_status_sink.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>

#include <mosquitto.h>

namespace ps {
namespace {

std::string error_text(int rc) {
  if (rc == MOSQ_ERR_ERRNO) return std::strerror(errno);
  return mosquitto_strerror(rc);
}

}  // namespace

MqttStatusSink::MqttStatusSink(BrokerConfig broker) : broker_(std::move(broker)) {}

MqttStatusSink::~MqttStatusSink() { close(); }

std::string MqttStatusSink::endpoint() const {
  return broker_.host + ":" + std::to_string(broker_.port);
}

void MqttStatusSink::on_connect_(struct mosquitto* /*m*/, void* self, int rc) {
  auto* sink = static_cast<MqttStatusSink*>(self);
  if (rc == 0) {
    sink->connected_ = true;
    std::cout << "mqtt: connected to " << sink->endpoint() << "\n";
  } else {
    sink->connected_ = false;
    std::cerr << "mqtt: broker " << sink->endpoint()
              << " refused connection: " << mosquitto_connack_string(rc) << "\n";
  }
}

void MqttStatusSink::on_disconnect_(struct mosquitto* /*m*/, void* self, int rc) {
  auto* sink = static_cast<MqttStatusSink*>(self);
  sink->connected_ = false;
  if (rc != 0) {
    std::cerr << "mqtt: connection to " << sink->endpoint() << " lost (" << error_text(rc)
              << "), reconnecting\n";
  }
}

Status MqttStatusSink::open(const RunInfo& run) {
  close();

  int rc = mosquitto_lib_init();
  if (rc != MOSQ_ERR_SUCCESS) {
    return Status::unavailable("mosquitto_lib_init failed: " + error_text(rc));
  }
  lib_init_ = true;

  mosq_ = mosquitto_new(run.client_id.c_str(), /*clean_session=*/true, this);
  if (!mosq_) {
    const std::string why = std::strerror(errno);
    close();
    return Status::io_error("mosquitto_new failed for client '" + run.client_id + "': " + why);
  }
  mosquitto_connect_callback_set(mosq_, &MqttStatusSink::on_connect_);
  mosquitto_disconnect_callback_set(mosq_, &MqttStatusSink::on_disconnect_);

  rc = mosquitto_reconnect_delay_set(mosq_, 1, 30, /*exponential=*/true);
  if (rc != MOSQ_ERR_SUCCESS) {
    const std::string why = error_text(rc);
    close();
    return Status::invalid_argument("mosquitto_reconnect_delay_set failed: " + why);
  }

  rc = mosquitto_connect(mosq_, broker_.host.c_str(), broker_.port, broker_.keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS) {
    const std::string why = error_text(rc);
    close();
    return Status::unavailable("connect to " + endpoint() + " failed: " + why);
  }

  rc = mosquitto_loop_start(mosq_);
  if (rc != MOSQ_ERR_SUCCESS) {
    const std::string why = error_text(rc);
    close();
    return Status::unavailable("mosquitto_loop_start failed: " + why);
  }
  loop_started_ = true;

  return Status::ok_status();
}

Status MqttStatusSink::publish(const std::string& topic, const std::string& payload, int qos,
                               bool retain) {
  if (!mosq_) return Status::unavailable("MqttStatusSink::publish called while not open");

  const int rc = mosquitto_publish(mosq_, /*mid=*/nullptr, topic.c_str(),
                                   static_cast<int>(payload.size()), payload.data(), qos, retain);
  if (rc != MOSQ_ERR_SUCCESS) {
    return Status::unavailable("publish to '" + topic + "' via " + endpoint() +
                               " failed: " + error_text(rc));
  }
  return Status::ok_status();
}

Status MqttStatusSink::flush() {
  if (!mosq_) return Status::ok_status();
  if (!connected_) return Status::unavailable("not connected to " + endpoint());
  return Status::ok_status();
}

void MqttStatusSink::close() {
  if (mosq_) {
    if (loop_started_) {
      const int rc = mosquitto_disconnect(mosq_);
      if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
        std::cerr << "mqtt: disconnect failed: " << error_text(rc) << "\n";
      }
      const int rc_stop = mosquitto_loop_stop(mosq_, /*force=*/false);
      if (rc_stop != MOSQ_ERR_SUCCESS) {
        std::cerr << "mqtt: stopping network thread failed: " << error_text(rc_stop) << "\n";
      }
      loop_started_ = false;
    }
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
  }
  connected_ = false;

  if (lib_init_) {
    mosquitto_lib_cleanup();
    lib_init_ = false;
  }
}

}  // namespace ps
