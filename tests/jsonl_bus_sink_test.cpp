// File: tests/jsonl_bus_sink_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "ps/core/events/jsonl_bus_sink.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;
using ps::test::read_file;
using ps::test::read_lines;
using ps::test::TempDir;

ps::RunInfo run_info(const TempDir& dir) {
  ps::RunInfo run;
  run.client_id = "SmartPark2026_P1";
  run.config_path = "config/default.yaml";
  run.out_dir = dir.str();
  run.config_hash = "cafef00d";
  run.spot_count = 20;
  run.seed = 2026;
  run.wall_start_time_ns = ps::TimestampNs{1'700'000'000'000'000'000LL};
  return run;
}

TEST(JsonlBusSink, OpenWritesRunHeaderToBothFiles) {
  TempDir dir("bus_open");
  ps::JsonlBusSink sink;
  ASSERT_TRUE(sink.open(run_info(dir)).ok());

  EXPECT_EQ(fs::path(sink.path()).filename().string(), "bus_1700000000000000000.jsonl");
  EXPECT_EQ(fs::path(sink.latest_path()).filename().string(), "bus_latest.jsonl");

  for (const auto& p : {sink.path(), sink.latest_path()}) {
    const auto lines = read_lines(p);
    ASSERT_EQ(lines.size(), 1u) << p;
    EXPECT_NE(lines[0].find("\"type\":\"run_started\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"client_id\":\"SmartPark2026_P1\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"config_hash\":\"cafef00d\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"spot_count\":20"), std::string::npos);
    EXPECT_NE(lines[0].find("\"seed\":2026"), std::string::npos);
  }

  // Empty retained store is materialized on open.
  EXPECT_TRUE(fs::exists(sink.retained_path()));
  EXPECT_EQ(read_file(sink.retained_path()), "{}\n");
  sink.close();
}

TEST(JsonlBusSink, PublishAppendsOneLinePerMessage) {
  TempDir dir("bus_publish");
  ps::JsonlBusSink sink;
  ASSERT_TRUE(sink.open(run_info(dir)).ok());

  ASSERT_TRUE(sink.publish("lot/spots/P01/status", "{\"status\":\"OCCUPIED\"}", 1, true).ok());
  ASSERT_TRUE(sink.publish("lot/nodes/n1/heartbeat", "alive", 0, false).ok());
  ASSERT_TRUE(sink.flush().ok());

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_NE(lines[1].find("\"topic\":\"lot/spots/P01/status\",\"qos\":1,\"retain\":true,"
                          "\"payload\":{\"status\":\"OCCUPIED\"}}"),
            std::string::npos)
      << lines[1];
  EXPECT_NE(lines[2].find("\"qos\":0,\"retain\":false,\"payload\":\"alive\"}"), std::string::npos)
      << lines[2];

  EXPECT_EQ(read_lines(sink.latest_path()), lines);
  sink.close();
}

TEST(JsonlBusSink, RetainedKeepsLastPayloadPerTopic) {
  TempDir dir("bus_retained");
  ps::JsonlBusSink sink;
  ASSERT_TRUE(sink.open(run_info(dir)).ok());

  ASSERT_TRUE(sink.publish("lot/spots/P01/status", "{\"status\":\"OCCUPIED\"}", 1, true).ok());
  ASSERT_TRUE(sink.publish("lot/spots/P02/status", "{\"status\":\"OCCUPIED\"}", 1, true).ok());
  ASSERT_TRUE(sink.publish("lot/spots/P01/status", "{\"status\":\"FREE\"}", 1, true).ok());
  ASSERT_TRUE(sink.publish("lot/nodes/n1/heartbeat", "{\"t_s\":1}", 0, false).ok());
  EXPECT_EQ(sink.retained_count(), 2u);

  ASSERT_TRUE(sink.flush().ok());
  const std::string retained = read_file(sink.retained_path());
  EXPECT_NE(retained.find("\"lot/spots/P01/status\":{\"status\":\"FREE\"}"), std::string::npos)
      << retained;
  EXPECT_NE(retained.find("\"lot/spots/P02/status\":{\"status\":\"OCCUPIED\"}"),
            std::string::npos);
  EXPECT_EQ(retained.find("heartbeat"), std::string::npos);
  EXPECT_FALSE(fs::exists(sink.retained_path() + ".tmp"));
  sink.close();
}

TEST(JsonlBusSink, EmptyRetainedPayloadClearsTopic) {
  TempDir dir("bus_clear");
  ps::JsonlBusSink sink;
  ASSERT_TRUE(sink.open(run_info(dir)).ok());

  ASSERT_TRUE(sink.publish("lot/spots/P01/status", "{\"status\":\"FREE\"}", 1, true).ok());
  ASSERT_TRUE(sink.publish("lot/spots/P01/status", "", 1, true).ok());
  EXPECT_EQ(sink.retained_count(), 0u);

  ASSERT_TRUE(sink.flush().ok());
  EXPECT_EQ(read_file(sink.retained_path()), "{}\n");
  sink.close();
}

TEST(JsonlBusSink, PublishWhileClosedIsUnavailable) {
  ps::JsonlBusSink sink;
  const ps::Status st = sink.publish("t", "{}", 1, true);
  EXPECT_EQ(st.code(), ps::Status::Code::kUnavailable);
  EXPECT_TRUE(sink.flush().ok());
}

TEST(JsonlBusSink, CloseIsIdempotentAndStopsPublishing) {
  TempDir dir("bus_close");
  ps::JsonlBusSink sink;
  ASSERT_TRUE(sink.open(run_info(dir)).ok());

  sink.close();
  sink.close();
  EXPECT_EQ(sink.publish("t", "{}", 1, true).code(), ps::Status::Code::kUnavailable);
  EXPECT_EQ(read_lines(sink.path()).size(), 1u);
}

TEST(JsonlBusSink, ReopenTruncatesLatestButKeepsPerRunFiles) {
  TempDir dir("bus_reopen");
  ps::JsonlBusSink sink;

  auto first = run_info(dir);
  ASSERT_TRUE(sink.open(first).ok());
  ASSERT_TRUE(sink.publish("a", "{}", 1, true).ok());
  ASSERT_TRUE(sink.flush().ok());
  const std::string first_path = sink.path();
  sink.close();

  auto second = run_info(dir);
  second.wall_start_time_ns = ps::TimestampNs{first.wall_start_time_ns.ns + 1};
  ASSERT_TRUE(sink.open(second).ok());

  EXPECT_NE(sink.path(), first_path);
  EXPECT_EQ(read_lines(first_path).size(), 2u);
  EXPECT_EQ(read_lines(sink.latest_path()).size(), 1u);
  EXPECT_EQ(sink.retained_count(), 0u);
  sink.close();
}

TEST(JsonlBusSink, OpenFailsWhenOutDirIsAFile) {
  TempDir dir("bus_bad_dir");
  const fs::path blocker = dir.path() / "not_a_dir";
  ps::test::write_file(blocker, "x");

  auto run = run_info(dir);
  run.out_dir = blocker.string();

  ps::JsonlBusSink sink;
  const ps::Status st = sink.open(run);
  EXPECT_EQ(st.code(), ps::Status::Code::kIoError);
}

}  // namespace
