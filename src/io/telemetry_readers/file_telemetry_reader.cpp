#include "file_telemetry_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

FileTelemetryReader::FileTelemetryReader(const std::string &filepath,
                                         bool live_mode)
    : live_mode_(live_mode) {
  if (filepath == "-") {
    input_ = &std::cin;
    live_mode_ = false;
    LOG(LogLevel::INFO, LogComponent::IO_READER,
        "Reading telemetry from stdin.");
    return;
  }

  telemetry_file_stream_.open(filepath);
  if (!telemetry_file_stream_.is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open telemetry source file: " << filepath << ".");
    throw std::runtime_error("Failed to open telemetry source file: " +
                             filepath);
  }
  input_ = &telemetry_file_stream_;
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened telemetry file: " << filepath
                                             << (live_mode_ ? " (tailing)"
                                                            : ""));
}

FileTelemetryReader::FileTelemetryReader(std::istream &stream)
    : input_(&stream) {}

FileTelemetryReader::~FileTelemetryReader() {
  if (telemetry_file_stream_.is_open())
    telemetry_file_stream_.close();
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "FileTelemetryReader closed. Lines read: "
          << line_number_ << ", rejected: " << rejected_count_);
}

bool FileTelemetryReader::is_exhausted() const { return exhausted_; }

std::vector<TelemetrySample> FileTelemetryReader::get_next_batch() {
  std::vector<TelemetrySample> batch;
  if (exhausted_ || !input_)
    return batch;

  batch.reserve(BATCH_SIZE);
  std::string line;

  while (batch.size() < BATCH_SIZE && std::getline(*input_, line)) {
    line_number_++;
    std::string trimmed = Utils::trim_copy(line);
    if (trimmed.empty())
      continue;

    try {
      batch.push_back(TelemetrySample::parse_from_json(
          trimmed, Utils::get_current_time_ms()));
    } catch (const MalformedSampleError &e) {
      rejected_count_++;
      DetectorMetrics::instance().samples_rejected.Increment();
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "Rejected malformed sample at line " << line_number_ << ": "
                                               << e.what());
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << batch.size() << " samples, now at line " << line_number_);

  if (input_->eof()) {
    if (live_mode_)
      input_->clear(); // Allow tailing the file
    else
      exhausted_ = true;
  } else if (input_->fail()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Telemetry stream entered a failed state at line " << line_number_);
    exhausted_ = true;
  }

  return batch;
}
