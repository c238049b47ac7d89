// File: src/core/model/node_runner.cpp
#include "ps/core/model/node_runner.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ps/core/events/status_event.hpp"
#include "ps/core/util/repro_hash.hpp"

namespace ps {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_bus_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "bus_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "bus_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;

  return std::stoll(mid);
}

}  // namespace

const char* to_string(StopReason r) {
  switch (r) {
    case StopReason::kStopRequested: return "stop requested";
    case StopReason::kMaxTicks:      return "max_ticks reached";
    case StopReason::kMaxRunTime:    return "max_runtime reached";
  }
  return "unknown";
}

NodeRunner::NodeRunner(Config cfg, std::string config_path)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)) {}

TimestampNs NodeRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

TimestampNs NodeRunner::since_start_ns() const {
  if (!started_) return TimestampNs{0};
  const auto now = std::chrono::steady_clock::now();
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void NodeRunner::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_bus_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status NodeRunner::start(StatusSink& sink) {
  if (started_) return Status::invalid_argument("NodeRunner::start called twice");

  // This run adds one bus file; keep keep_last including it.
  if (cfg_.output.type == "jsonl") {
    prune_out_dir(cfg_.output.out_dir,
                  static_cast<std::size_t>(std::max(0, cfg_.output.keep_last - 1)));
  }

  t0_steady_ = std::chrono::steady_clock::now();
  t0_wall_ns_ = wall_now_epoch_ns();

  RunInfo run;
  run.client_id = cfg_.client_id;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.spot_count = resolve_spot_ids(cfg_.spots).size();
  run.seed = cfg_.world.seed;
  run.wall_start_time_ns = t0_wall_ns_;

  PS_RETURN_IF_ERROR(sink.open(run));
  started_ = true;
  return Status::ok_status();
}

Status NodeRunner::emit_heartbeat(StatusSink& sink, const std::string& message) {
  const TimestampNs t = since_start_ns();

  std::ostringstream ss;
  ss << "{"
     << "\"client_id\":" << json_quote(cfg_.client_id) << ","
     << "\"t_s\":" << json_number(ns_to_seconds(t.ns)) << ","
     << "\"message\":" << json_quote(message) << ","
     << "\"ts\":\"" << format_local_iso8601(wall_now_epoch_ns()) << "\""
     << "}";

  return sink.publish(heartbeat_topic(cfg_.topic_namespace, cfg_.client_id), ss.str(),
                      /*qos=*/0, /*retain=*/false);
}

Result<StopReason> NodeRunner::run(PublisherLoop& loop, StatusSink& sink, const StopFlag& stop) {
  if (!started_) {
    return Result<StopReason>::err(Status::invalid_argument("NodeRunner::run called before start"));
  }

  using clock = StopFlag::Clock;

  const auto tick_period = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(cfg_.loop.interval_s));
  const auto hb_period = std::chrono::seconds(cfg_.loop.heartbeat_every_s);
  const auto max_run = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(cfg_.loop.max_run_s));

  const auto t_start = clock::now();
  auto next_tick = t_start;
  auto last_hb = t_start - hb_period;  // first heartbeat goes out with the first sweep

  std::int64_t tick_count = 0;

  while (true) {
    if (stop.stop_requested()) return Result<StopReason>::ok(StopReason::kStopRequested);

    const auto now = clock::now();
    if (cfg_.loop.max_run_s > 0.0 && now - t_start >= max_run) {
      return Result<StopReason>::ok(StopReason::kMaxRunTime);
    }

    if (cfg_.loop.heartbeat_every_s > 0 && now - last_hb >= hb_period) {
      last_hb = now;
      const Status st = emit_heartbeat(sink, "alive tick=" + std::to_string(tick_count));
      if (!st.ok()) std::cerr << "heartbeat failed: " << st.message() << "\n";
    }

    loop.tick(since_start_ns(), wall_now_epoch_ns());

    const Status st_flush = sink.flush();
    if (!st_flush.ok()) std::cerr << "flush failed: " << st_flush.message() << "\n";

    ++tick_count;
    if (cfg_.loop.max_ticks > 0 && tick_count >= cfg_.loop.max_ticks) {
      return Result<StopReason>::ok(StopReason::kMaxTicks);
    }

    // Fixed cadence; after an overrun, restart the cadence instead of bursting to catch up.
    next_tick += tick_period;
    const auto after = clock::now();
    if (after > next_tick) next_tick = after;

    if (stop.wait_until(next_tick)) return Result<StopReason>::ok(StopReason::kStopRequested);
  }
}

void NodeRunner::stop(StatusSink& sink) {
  if (!started_) return;
  started_ = false;

  const Status st = sink.flush();
  if (!st.ok()) std::cerr << "final flush failed: " << st.message() << "\n";
  sink.close();
}

}  // namespace ps
