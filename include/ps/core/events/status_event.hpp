// File: include/ps/core/events/status_event.hpp
#pragma once

#include <string>

#include "ps/core/types.hpp"

namespace ps {

// One confirmed status change, as put on the bus.
// Keep the payload stable; evolve by adding fields (not renaming existing ones).
struct StatusEvent {
  SpotId spot_id;
  SpotStatus status = SpotStatus::kFree;
  double distance_cm = 0.0;  // reading that produced this step (rounded when serialized)
  double threshold_cm = 0.0;
  int debounce_n = 0;
  TimestampNs t_wall_ns;
};

// <ns>/spots/<spot_id>/status
std::string status_topic(const std::string& topic_namespace, const SpotId& spot_id);

// <ns>/nodes/<client_id>/heartbeat
std::string heartbeat_topic(const std::string& topic_namespace, const ClientId& client_id);

// {"spot_id":..,"status":..,"distance_cm":..,"threshold_cm":..,"debounce_n":..,"ts":..}
std::string to_json(const StatusEvent& e);

// Local time, second precision: YYYY-MM-DDTHH:MM:SS
std::string format_local_iso8601(TimestampNs t_wall_ns);

// Round half away from zero to one decimal place.
double round_to_tenth(double v);

// round_to_tenth, printed with exactly one decimal ("12.3", "200.0").
std::string format_tenth(double v);

// JSON string literal (quotes included) with the required escapes applied.
std::string json_quote(const std::string& s);

// JSON number with up to 12 significant digits and no trailing zeros ("50", "47.25").
std::string json_number(double v);

// json_number that always reads back as a real ("50.0", "47.25").
std::string json_real(double v);

}  // namespace ps
