#include "file_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <cmath>

FileDispatcher::FileDispatcher(const std::string &file_path)
    : alert_file_output_path_(file_path) {
  if (!alert_file_output_path_.empty())
    open_stream();
}

FileDispatcher::~FileDispatcher() {
  if (alert_file_stream_.is_open()) {
    alert_file_stream_.flush();
    alert_file_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "Closed alert log " << alert_file_output_path_ << " after "
                            << records_written_ << " records");
  }
}

bool FileDispatcher::open_stream() {
  Utils::create_directory_for_file(alert_file_output_path_);
  alert_file_stream_.clear();
  alert_file_stream_.open(alert_file_output_path_, std::ios::app);
  if (!alert_file_stream_.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Could not open alert log: " << alert_file_output_path_);
    return false;
  }
  return true;
}

nlohmann::json FileDispatcher::build_record(const Alert &alert,
                                            uint64_t sequence) {
  nlohmann::json record = JsonFormatter::alert_to_json_object(alert);
  record["sequence"] = sequence;

  // Derived quantities are omitted when voltage or current is zero
  double apparent_power = alert.voltage * alert.current;
  if (std::isfinite(apparent_power) && apparent_power > 0.0) {
    record["reading"]["apparent_power"] = apparent_power;
    record["reading"]["power_factor"] = alert.power / apparent_power;
  }
  return record;
}

bool FileDispatcher::dispatch(const Alert &alert) {
  if (alert_file_output_path_.empty())
    return false;
  if (!alert_file_stream_.is_open() && !open_stream()) {
    failed_writes_++;
    return false;
  }

  std::string line = build_record(alert, records_written_ + 1).dump();
  alert_file_stream_ << line << std::endl;
  if (!alert_file_stream_.good()) {
    failed_writes_++;
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Failed to write alert for " << alert.device_id << " to "
                                     << alert_file_output_path_
                                     << ", reopening on the next alert");
    alert_file_stream_.close();
    return false;
  }

  records_written_++;
  LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
      "Alert #" << records_written_ << " written to "
                << alert_file_output_path_ << ": " << line);
  return true;
}
