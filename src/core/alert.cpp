#include "alert.hpp"

#include <string>
#include <utility>

Alert::Alert(std::string device_id, uint64_t timestamp_ms, Finding finding)
    : device_id(std::move(device_id)), event_timestamp_ms(timestamp_ms),
      finding(std::move(finding)) {}

std::string Alert::throttle_key() const {
  return device_id + ":" + anomaly_kind_to_string(finding.kind);
}
