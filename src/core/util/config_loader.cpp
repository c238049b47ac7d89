// src/core/util/config_loader.cpp
#include "ps/core/util/config_loader.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace ps {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

// Accepts `[lo, hi]` or `{min: lo, max: hi}`.
static Status maybe_set_range(const YAML::Node& n, const char* key, RangeD& out) {
  if (!n || !n[key]) return Status::ok_status();
  const YAML::Node r = n[key];

  if (r.IsSequence()) {
    if (r.size() != 2) {
      return Status::invalid_argument(std::string(key) + " must be a [lo, hi] pair");
    }
    out.lo = r[0].as<double>();
    out.hi = r[1].as<double>();
    return Status::ok_status();
  }
  if (r.IsMap()) {
    maybe_set(r, "min", out.lo);
    maybe_set(r, "max", out.hi);
    return Status::ok_status();
  }
  return Status::invalid_argument(std::string(key) + " must be [lo, hi] or {min, max}");
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(
        Status::invalid_argument("includes nested too deeply (cycle?) at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }

    // Finally override with this file's contents (excluding includes itself).
    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Status apply_yaml(const YAML::Node& y, Config& cfg) {
  // --- identity
  maybe_set(y, "client_id", cfg.client_id);
  maybe_set(y, "topic_namespace", cfg.topic_namespace);

  // --- spots
  if (is_map(y["spots"])) {
    const auto s = y["spots"];
    if (s["ids"]) {
      if (!s["ids"].IsSequence()) return Status::invalid_argument("spots.ids must be a YAML sequence");
      cfg.spots.ids = s["ids"].as<std::vector<std::string>>();
    }
    maybe_set(s, "count", cfg.spots.count);
    maybe_set(s, "prefix", cfg.spots.prefix);
  }

  // --- detection
  if (is_map(y["detection"])) {
    const auto d = y["detection"];
    maybe_set(d, "threshold_cm", cfg.detection.threshold_cm);
    maybe_set(d, "debounce_n", cfg.detection.debounce_n);
  }

  // --- sensor
  if (is_map(y["sensor"])) {
    const auto s = y["sensor"];
    PS_RETURN_IF_ERROR(maybe_set_range(s, "occupied_range_cm", cfg.sensor.occupied_range_cm));
    PS_RETURN_IF_ERROR(maybe_set_range(s, "free_range_cm", cfg.sensor.free_range_cm));
    maybe_set(s, "noise_cm", cfg.sensor.noise_cm);
  }

  // --- world
  if (is_map(y["world"])) {
    const auto w = y["world"];
    PS_RETURN_IF_ERROR(maybe_set_range(w, "occupied_dwell_s", cfg.world.occupied_dwell_s));
    PS_RETURN_IF_ERROR(maybe_set_range(w, "free_dwell_s", cfg.world.free_dwell_s));
    PS_RETURN_IF_ERROR(maybe_set_range(w, "activity", cfg.world.activity));
    maybe_set(w, "seed", cfg.world.seed);
  }

  // --- loop
  if (is_map(y["loop"])) {
    const auto l = y["loop"];
    maybe_set(l, "interval_s", cfg.loop.interval_s);
    maybe_set(l, "heartbeat_every_s", cfg.loop.heartbeat_every_s);
    maybe_set(l, "max_ticks", cfg.loop.max_ticks);
    maybe_set(l, "max_run_s", cfg.loop.max_run_s);
  }

  // --- broker
  if (is_map(y["broker"])) {
    const auto b = y["broker"];
    maybe_set(b, "host", cfg.broker.host);
    maybe_set(b, "port", cfg.broker.port);
    maybe_set(b, "keepalive_s", cfg.broker.keepalive_s);
  }

  // --- publish
  if (is_map(y["publish"])) {
    const auto p = y["publish"];
    maybe_set(p, "qos", cfg.publish.qos);
    maybe_set(p, "retain", cfg.publish.retain);
    maybe_set(p, "announce_initial", cfg.publish.announce_initial);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "type", cfg.output.type);
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_last", cfg.output.keep_last);
  }

  return Status::ok_status();
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  if (y && !y.IsNull() && !y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map: " + path_str));
  }

  Config cfg;  // defaults

  try {
    const Status s = apply_yaml(y, cfg);
    if (!s.ok()) return Result<Config>::err(s);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(
        Status::invalid_argument("bad value in " + path_str + ": " + e.what()));
  }

  return Result<Config>::ok(cfg);
}

}  // namespace ps
