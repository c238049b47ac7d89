// File: src/core/events/status_event.cpp
#include "ps/core/events/status_event.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ps {

std::string status_topic(const std::string& topic_namespace, const SpotId& spot_id) {
  return topic_namespace + "/spots/" + spot_id + "/status";
}

std::string heartbeat_topic(const std::string& topic_namespace, const ClientId& client_id) {
  return topic_namespace + "/nodes/" + client_id + "/heartbeat";
}

double round_to_tenth(double v) { return std::round(v * 10.0) / 10.0; }

std::string format_tenth(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << round_to_tenth(v);
  return ss.str();
}

std::string json_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
  return out;
}

std::string json_number(double v) {
  std::ostringstream ss;
  ss << std::setprecision(12) << v;
  return ss.str();
}

std::string json_real(double v) {
  std::string out = json_number(v);
  if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
  return out;
}

std::string format_local_iso8601(TimestampNs t_wall_ns) {
  const std::time_t secs = static_cast<std::time_t>(t_wall_ns.ns / 1'000'000'000);
  std::tm tm{};
  localtime_r(&secs, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

std::string to_json(const StatusEvent& e) {
  std::ostringstream ss;
  ss << "{"
     << "\"spot_id\":" << json_quote(e.spot_id) << ","
     << "\"status\":\"" << to_string(e.status) << "\","
     << "\"distance_cm\":" << format_tenth(e.distance_cm) << ","
     << "\"threshold_cm\":" << json_real(e.threshold_cm) << ","
     << "\"debounce_n\":" << e.debounce_n << ","
     << "\"ts\":\"" << format_local_iso8601(e.t_wall_ns) << "\""
     << "}";
  return ss.str();
}

}  // namespace ps
