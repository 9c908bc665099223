#ifndef ALERT_HPP
#define ALERT_HPP

#include "finding.hpp"

#include <cstdint>
#include <string>

// A finding tied to the device and reading that produced it
struct Alert {
  std::string device_id;
  uint64_t event_timestamp_ms = 0;
  Finding finding;

  // Observed readings, for context in the outputs
  double voltage = 0.0;
  double current = 0.0;
  double power = 0.0;

  Alert(std::string device_id, uint64_t timestamp_ms, Finding finding);

  // Throttle identity: one cooldown per device and anomaly kind
  std::string throttle_key() const;
};

#endif // ALERT_HPP
