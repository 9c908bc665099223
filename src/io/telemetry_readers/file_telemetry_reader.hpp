#ifndef FILE_TELEMETRY_READER_HPP
#define FILE_TELEMETRY_READER_HPP

#include "base_telemetry_reader.hpp"

#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

// Reads one JSON sample per line from a file, or from stdin when the path
// is "-". In live mode end-of-file is not final and the file is tailed.
class FileTelemetryReader : public ITelemetryReader {
public:
  // Throws std::runtime_error when the file cannot be opened
  explicit FileTelemetryReader(const std::string &filepath,
                               bool live_mode = false);
  explicit FileTelemetryReader(std::istream &stream);
  ~FileTelemetryReader() override;

  std::vector<TelemetrySample> get_next_batch() override;
  bool is_exhausted() const override;
  uint64_t get_rejected_count() const override { return rejected_count_; }

  uint64_t get_line_number() const { return line_number_; }

private:
  std::ifstream telemetry_file_stream_;
  std::istream *input_ = nullptr;
  bool live_mode_ = false;
  bool exhausted_ = false;
  uint64_t line_number_ = 0;
  uint64_t rejected_count_ = 0;
  static constexpr size_t BATCH_SIZE = 1000;
};

#endif // FILE_TELEMETRY_READER_HPP
