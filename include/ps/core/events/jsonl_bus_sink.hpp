// File: include/ps/core/events/jsonl_bus_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <map>
#include <string>

#include "ps/core/events/status_sink.hpp"
#include "ps/core/status.hpp"

namespace ps {

// File-backed message bus.
// Writes every published message as one JSON line to:
//   1) a unique per-run file: bus_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: bus_latest.jsonl (truncated each run)
// Retained messages are kept per topic (last one wins, empty payload clears) and written to
// retained.json on flush().
class JsonlBusSink final : public StatusSink {
 public:
  JsonlBusSink() = default;
  ~JsonlBusSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }
  const std::string& retained_path() const { return retained_path_; }
  std::size_t retained_count() const { return retained_.size(); }

  Status open(const RunInfo& run) override;
  Status publish(const std::string& topic, const std::string& payload, int qos,
                 bool retain) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);
  Status write_retained_();

  bool open_{false};

  std::string path_;
  std::string latest_path_;
  std::string retained_path_;

  std::ofstream f_;
  std::ofstream latest_;

  std::map<std::string, std::string> retained_;  // topic -> payload
  bool retained_dirty_{false};
};

}  // namespace ps
