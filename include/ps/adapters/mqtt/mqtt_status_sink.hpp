// File: include/ps/adapters/mqtt/mqtt_status_sink.hpp
#pragma once

#include <atomic>
#include <string>

#include "ps/core/config.hpp"
#include "ps/core/events/status_sink.hpp"
#include "ps/core/status.hpp"

struct mosquitto;  // libmosquitto client handle

namespace ps {

// StatusSink backed by an MQTT broker (libmosquitto).
// open() connects with the run's client id and starts the client's network thread; publish()
// hands the message to that thread and returns without waiting for the broker. Lost
// connections are re-established in the background (1 s .. 30 s backoff). Any publish the
// client rejects is reported as kUnavailable and not retried here.
class MqttStatusSink final : public StatusSink {
 public:
  explicit MqttStatusSink(BrokerConfig broker);
  ~MqttStatusSink() override;

  MqttStatusSink(const MqttStatusSink&) = delete;
  MqttStatusSink& operator=(const MqttStatusSink&) = delete;

  Status open(const RunInfo& run) override;
  Status publish(const std::string& topic, const std::string& payload, int qos,
                 bool retain) override;

  // Nothing is buffered on this side; reports whether the broker session is up.
  Status flush() override;

  // Disconnects, stops the network thread and releases the client.
  void close() override;

  bool connected() const { return connected_.load(); }
  std::string endpoint() const;  // host:port

 private:
  static void on_connect_(struct mosquitto* m, void* self, int rc);
  static void on_disconnect_(struct mosquitto* m, void* self, int rc);

  BrokerConfig broker_;

  struct mosquitto* mosq_{nullptr};
  bool lib_init_{false};
  bool loop_started_{false};
  std::atomic<bool> connected_{false};
};

}  // namespace ps
