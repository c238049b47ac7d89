// File: tests/mqtt_status_sink_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include "ps/adapters/mqtt/mqtt_status_sink.hpp"

namespace {

ps::RunInfo run_info(const std::string& client_id) {
  ps::RunInfo run;
  run.client_id = client_id;
  run.config_path = "test.yaml";
  run.spot_count = 1;
  return run;
}

ps::BrokerConfig local_broker(int port) {
  ps::BrokerConfig b;
  b.host = "127.0.0.1";
  b.port = port;
  b.keepalive_s = 10;
  return b;
}

TEST(MqttStatusSink, PublishBeforeOpenIsUnavailable) {
  ps::MqttStatusSink sink(local_broker(1883));
  const ps::Status st = sink.publish("lot/spots/P01/status", "{}", 1, true);
  EXPECT_EQ(st.code(), ps::Status::Code::kUnavailable);
  EXPECT_TRUE(sink.flush().ok());
  EXPECT_FALSE(sink.connected());
}

TEST(MqttStatusSink, CloseWithoutOpenIsSafe) {
  ps::MqttStatusSink sink(local_broker(1883));
  sink.close();
  sink.close();
  EXPECT_FALSE(sink.connected());
}

TEST(MqttStatusSink, EndpointIsHostAndPort) {
  ps::BrokerConfig b;
  EXPECT_EQ(ps::MqttStatusSink(b).endpoint(), "broker.emqx.io:1883");
  EXPECT_EQ(ps::MqttStatusSink(local_broker(8883)).endpoint(), "127.0.0.1:8883");
}

TEST(MqttStatusSink, RefusedConnectionFailsOpen) {
  // Nothing listens on port 1 of the loopback interface.
  ps::MqttStatusSink sink(local_broker(1));
  const ps::Status st = sink.open(run_info("ps-test-refused"));
  ASSERT_FALSE(st.ok());
  EXPECT_EQ(st.code(), ps::Status::Code::kUnavailable);
  EXPECT_NE(st.message().find("127.0.0.1:1"), std::string::npos) << st.message();

  // A failed open leaves the sink closed.
  EXPECT_EQ(sink.publish("t", "{}", 1, true).code(), ps::Status::Code::kUnavailable);
  sink.close();
}

// Runs only when a broker is provided, e.g. PS_TEST_MQTT_HOST=localhost.
TEST(MqttStatusSink, PublishesToLiveBroker) {
  const char* host = std::getenv("PS_TEST_MQTT_HOST");
  if (host == nullptr || *host == '\0') GTEST_SKIP() << "PS_TEST_MQTT_HOST not set";

  ps::BrokerConfig b;
  b.host = host;
  ps::MqttStatusSink sink(b);
  ASSERT_TRUE(sink.open(run_info("ps-test-live")).ok());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!sink.connected() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_TRUE(sink.connected());
  EXPECT_TRUE(sink.flush().ok());

  EXPECT_TRUE(sink.publish("ps_test/spots/P01/status", "{\"status\":\"FREE\"}", 1, false).ok());
  EXPECT_TRUE(sink.publish("ps_test/nodes/n/heartbeat", "{}", 0, false).ok());

  sink.close();
  EXPECT_FALSE(sink.connected());
  EXPECT_EQ(sink.publish("t", "{}", 1, false).code(), ps::Status::Code::kUnavailable);
}

}  // namespace
