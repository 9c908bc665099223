#ifndef BASE_TELEMETRY_READER_HPP
#define BASE_TELEMETRY_READER_HPP

#include "core/telemetry_sample.hpp"

#include <cstdint>
#include <vector>

class ITelemetryReader {
public:
  virtual ~ITelemetryReader() = default;

  // Fetches the next batch of samples. The definition of a "batch" is
  // implementation-specific. Returns an empty vector if nothing new arrived.
  virtual std::vector<TelemetrySample> get_next_batch() = 0;

  // True once the source can produce nothing more
  virtual bool is_exhausted() const = 0;

  // Payloads dropped because they could not become a sample
  virtual uint64_t get_rejected_count() const = 0;
};

#endif // BASE_TELEMETRY_READER_HPP
