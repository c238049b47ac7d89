// File: src/core/events/jsonl_bus_sink.cpp
#include "ps/core/events/jsonl_bus_sink.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

#include "ps/core/events/status_event.hpp"

namespace ps {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

std::int64_t wall_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// Object payloads are embedded as JSON; anything else is carried as a string.
std::string payload_as_json(const std::string& payload) {
  if (!payload.empty() && payload.front() == '{' && payload.back() == '}') return payload;
  return json_quote(payload);
}

}  // namespace

JsonlBusSink::~JsonlBusSink() { close(); }

Status JsonlBusSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;

  path_ = join_path(run.out_dir, "bus_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "bus_latest.jsonl");
  retained_path_ = join_path(run.out_dir, "retained.json");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  retained_.clear();
  retained_dirty_ = true;  // a fresh run starts with an empty retained store
  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"client_id\":" << json_quote(run.client_id) << ","
     << "\"config_path\":" << json_quote(run.config_path) << ","
     << "\"config_hash\":\"" << run.config_hash << "\","
     << "\"spot_count\":" << run.spot_count << ","
     << "\"seed\":" << run.seed
     << "}";

  PS_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlBusSink::publish(const std::string& topic, const std::string& payload, int qos,
                             bool retain) {
  if (!open_) return Status::unavailable("JsonlBusSink::publish called while not open");

  std::ostringstream ss;
  ss << "{"
     << "\"t_wall_ns\":" << wall_now_ns() << ","
     << "\"topic\":" << json_quote(topic) << ","
     << "\"qos\":" << qos << ","
     << "\"retain\":" << (retain ? "true" : "false") << ","
     << "\"payload\":" << payload_as_json(payload)
     << "}";

  if (retain) {
    if (payload.empty()) {
      retained_.erase(topic);
    } else {
      retained_[topic] = payload;
    }
    retained_dirty_ = true;
  }

  return write_line_(ss.str());
}

Status JsonlBusSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlBusSink::write_retained_() {
  namespace fs = std::filesystem;

  // Write beside the target and rename so readers never see a half-written file.
  const std::string tmp = retained_path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out.is_open()) return Status::io_error("failed opening '" + tmp + "'");

    out << "{";
    bool first = true;
    for (const auto& [topic, payload] : retained_) {
      if (!first) out << ",";
      first = false;
      out << "\n  " << json_quote(topic) << ":" << payload_as_json(payload);
    }
    out << (retained_.empty() ? "}" : "\n}") << "\n";

    out.flush();
    if (!out.good()) return Status::io_error("failed writing '" + tmp + "'");
  }

  std::error_code ec;
  fs::rename(tmp, retained_path_, ec);
  if (ec) {
    return Status::io_error("failed renaming '" + tmp + "' to '" + retained_path_ + "': " +
                            ec.message());
  }

  retained_dirty_ = false;
  return Status{};
}

Status JsonlBusSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  if (retained_dirty_) return write_retained_();
  return Status{};
}

void JsonlBusSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace ps
