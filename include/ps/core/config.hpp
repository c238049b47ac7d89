// include/ps/core/config.hpp
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "ps/core/status.hpp"
#include "ps/core/types.hpp"

namespace ps {

// Units policy:
// - Distances in centimetres
// - Dwell times and intervals configured in seconds, held as nanoseconds where they drive time

// -----------------------------
// Fleet
// -----------------------------
struct SpotsConfig {
  // Explicit ids win. If empty, ids are generated as prefix + 2-digit index (P01..P20).
  std::vector<SpotId> ids;
  int count = 20;
  std::string prefix = "P";
};

// -----------------------------
// Detection / debounce
// -----------------------------
struct DetectionConfig {
  // Readings strictly below this are an instantaneous "occupied" detection.
  double threshold_cm = 50.0;

  // Consecutive same-direction detections required to commit a status change.
  int debounce_n = 4;
};

// -----------------------------
// Simulated distance sensor
// -----------------------------
struct SensorConfig {
  RangeD occupied_range_cm{10.0, 35.0};
  RangeD free_range_cm{150.0, 280.0};
  double noise_cm = 2.0;  // uniform in [-noise, +noise]
};

// -----------------------------
// Latent world (ground truth)
// -----------------------------
struct WorldConfig {
  // Dwell base durations, divided by the per-spot activity factor.
  RangeD occupied_dwell_s{45.0, 180.0};
  RangeD free_dwell_s{30.0, 150.0};

  // Per-spot activity factor, drawn once at creation.
  RangeD activity{0.6, 1.6};

  // 0 = seed from std::random_device (non-reproducible runs).
  std::uint32_t seed = 0;
};

// -----------------------------
// Loop cadence and run limits
// -----------------------------
struct LoopConfig {
  double interval_s = 1.0;
  int heartbeat_every_s = 30;  // 0 disables
  std::int64_t max_ticks = 0;  // 0 disables
  double max_run_s = 0.0;      // 0 disables
};

// -----------------------------
// Message broker (MQTT)
// -----------------------------
struct BrokerConfig {
  std::string host = "broker.emqx.io";
  int port = 1883;
  int keepalive_s = 60;
};

// -----------------------------
// Publish options for status messages
// -----------------------------
struct PublishConfig {
  int qos = 1;
  bool retain = true;

  // true: nothing counts as published at start, so tick 1 announces every spot's FREE.
  // false: the initial FREE counts as already published; only real transitions go out.
  bool announce_initial = true;
};

// -----------------------------
// Output
// -----------------------------
struct OutputConfig {
  // "mqtt": publish to the broker. "jsonl": offline bus files under out_dir.
  std::string type = "mqtt";

  std::string out_dir = "out";
  int keep_last = 50;  // older per-run bus files are pruned at start
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  ClientId client_id = "SmartPark2026_P1";
  std::string topic_namespace = "smart_parking_2026/parking";

  SpotsConfig spots;
  DetectionConfig detection;
  SensorConfig sensor;
  WorldConfig world;
  LoopConfig loop;
  BrokerConfig broker;
  PublishConfig publish;
  OutputConfig output;
};

// Ids in sweep order: the explicit list if given, else prefix + 2-digit index.
std::vector<SpotId> resolve_spot_ids(const SpotsConfig& spots);

// Keep it strict; fail early.
inline Status validate_config(const Config& cfg) {
  if (cfg.client_id.empty()) {
    return Status::invalid_argument("client_id must not be empty");
  }
  if (cfg.topic_namespace.empty()) {
    return Status::invalid_argument("topic_namespace must not be empty");
  }

  if (cfg.spots.ids.empty() && cfg.spots.count <= 0) {
    return Status::invalid_argument("spots: need a non-empty spots.ids list or spots.count > 0");
  }
  std::set<SpotId> seen;
  for (const auto& id : cfg.spots.ids) {
    if (id.empty()) return Status::invalid_argument("spots.ids must not contain empty ids");
    if (!seen.insert(id).second) return Status::invalid_argument("duplicate spot id: " + id);
  }

  if (!(cfg.detection.threshold_cm > 0.0 && cfg.detection.threshold_cm <= 1000.0)) {
    return Status::invalid_argument("detection.threshold_cm must be in (0, 1000]");
  }
  if (cfg.detection.debounce_n < 1) {
    return Status::invalid_argument("detection.debounce_n must be >= 1");
  }

  if (!cfg.sensor.occupied_range_cm.is_valid() || cfg.sensor.occupied_range_cm.lo < 0.0) {
    return Status::invalid_argument("sensor.occupied_range_cm must be [lo, hi] with 0 <= lo <= hi");
  }
  if (!cfg.sensor.free_range_cm.is_valid() || cfg.sensor.free_range_cm.lo < 0.0) {
    return Status::invalid_argument("sensor.free_range_cm must be [lo, hi] with 0 <= lo <= hi");
  }
  if (cfg.sensor.noise_cm < 0.0) {
    return Status::invalid_argument("sensor.noise_cm must be >= 0");
  }

  if (!cfg.world.occupied_dwell_s.is_valid() || cfg.world.occupied_dwell_s.lo <= 0.0) {
    return Status::invalid_argument("world.occupied_dwell_s must be [lo, hi] with 0 < lo <= hi");
  }
  if (!cfg.world.free_dwell_s.is_valid() || cfg.world.free_dwell_s.lo <= 0.0) {
    return Status::invalid_argument("world.free_dwell_s must be [lo, hi] with 0 < lo <= hi");
  }
  if (!cfg.world.activity.is_valid() || cfg.world.activity.lo <= 0.0) {
    return Status::invalid_argument("world.activity must be [lo, hi] with 0 < lo <= hi");
  }

  if (cfg.loop.interval_s <= 0.0) {
    return Status::invalid_argument("loop.interval_s must be > 0");
  }
  if (cfg.loop.heartbeat_every_s < 0) {
    return Status::invalid_argument("loop.heartbeat_every_s must be >= 0");
  }
  if (cfg.loop.max_ticks < 0) {
    return Status::invalid_argument("loop.max_ticks must be >= 0");
  }
  if (cfg.loop.max_run_s < 0.0) {
    return Status::invalid_argument("loop.max_run_s must be >= 0");
  }

  if (cfg.publish.qos < 0 || cfg.publish.qos > 2) {
    return Status::invalid_argument("publish.qos must be 0, 1 or 2");
  }

  if (cfg.output.type != "mqtt" && cfg.output.type != "jsonl") {
    return Status::invalid_argument("output.type must be 'mqtt' or 'jsonl'");
  }
  if (cfg.output.type == "mqtt") {
    if (cfg.broker.host.empty()) {
      return Status::invalid_argument("broker.host must not be empty");
    }
    if (cfg.broker.port < 1 || cfg.broker.port > 65535) {
      return Status::invalid_argument("broker.port must be in 1..65535");
    }
    if (cfg.broker.keepalive_s < 5 || cfg.broker.keepalive_s > 65535) {
      return Status::invalid_argument("broker.keepalive_s must be in 5..65535");
    }
  }

  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.keep_last < 1) {
    return Status::invalid_argument("output.keep_last must be >= 1");
  }
  return Status::ok_status();
}

}  // namespace ps
