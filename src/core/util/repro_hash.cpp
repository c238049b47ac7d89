// File: src/core/util/repro_hash.cpp
#include "ps/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace ps {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u32(std::uint32_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }

  void add_range(const RangeD& r) {
    add_double(r.lo);
    add_double(r.hi);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Identity.
  h.add_string(cfg.client_id);
  h.add_string(cfg.topic_namespace);

  // Fleet: hash the resolved ids so an explicit list and the equivalent generated one match.
  const auto ids = resolve_spot_ids(cfg.spots);
  h.add_u64(static_cast<std::uint64_t>(ids.size()));
  for (const auto& id : ids) h.add_string(id);

  // Detection.
  h.add_double(cfg.detection.threshold_cm);
  h.add_i32(cfg.detection.debounce_n);

  // Sensor.
  h.add_range(cfg.sensor.occupied_range_cm);
  h.add_range(cfg.sensor.free_range_cm);
  h.add_double(cfg.sensor.noise_cm);

  // World.
  h.add_range(cfg.world.occupied_dwell_s);
  h.add_range(cfg.world.free_dwell_s);
  h.add_range(cfg.world.activity);
  h.add_u32(cfg.world.seed);

  // Loop.
  h.add_double(cfg.loop.interval_s);
  h.add_i32(cfg.loop.heartbeat_every_s);
  h.add_i64(cfg.loop.max_ticks);
  h.add_double(cfg.loop.max_run_s);

  // Broker.
  h.add_string(cfg.broker.host);
  h.add_i32(cfg.broker.port);
  h.add_i32(cfg.broker.keepalive_s);

  // Publish.
  h.add_i32(cfg.publish.qos);
  h.add_bool(cfg.publish.retain);
  h.add_bool(cfg.publish.announce_initial);

  // Output.
  h.add_string(cfg.output.type);
  h.add_string(cfg.output.out_dir);
  h.add_i32(cfg.output.keep_last);

  return to_hex(h.h);
}

}  // namespace ps
