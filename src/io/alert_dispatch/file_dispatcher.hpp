#ifndef FILE_DISPATCHER_HPP
#define FILE_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

// Appends one JSON record per power alert to a log file. Each record carries
// a sequence number and the apparent power and power factor derived from the
// reading. A failed write closes the file; the next alert reopens it, so a
// rotated or deleted log is picked up again.
class FileDispatcher : public IAlertDispatcher {
public:
  explicit FileDispatcher(const std::string &file_path);
  ~FileDispatcher() override;

  bool dispatch(const Alert &alert) override;
  const char *get_name() const override { return "FileDispatcher"; }
  std::string get_dispatcher_type() const override { return "file"; }

  bool is_open() const { return alert_file_stream_.is_open(); }
  uint64_t get_records_written() const { return records_written_; }
  uint64_t get_failed_writes() const { return failed_writes_; }

  static nlohmann::json build_record(const Alert &alert, uint64_t sequence);

private:
  bool open_stream();

  std::string alert_file_output_path_;
  std::ofstream alert_file_stream_;
  uint64_t records_written_ = 0;
  uint64_t failed_writes_ = 0;
};

#endif // FILE_DISPATCHER_HPP
