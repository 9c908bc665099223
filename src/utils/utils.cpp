#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::optional<uint64_t> convert_iso8601_to_ms(std::string_view time_str) {
  if (time_str.empty())
    return std::nullopt;

  // Expected format: 2025-05-23T00:00:35[.123][Z|+05:30|-0100]
  std::string buffer(time_str);
  std::tm t{};
  int consumed = 0;
  if (std::sscanf(buffer.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &t.tm_year,
                  &t.tm_mon, &t.tm_mday, &t.tm_hour, &t.tm_min, &t.tm_sec,
                  &consumed) != 6)
    return std::nullopt;

  if (t.tm_mon < 1 || t.tm_mon > 12 || t.tm_mday < 1 || t.tm_mday > 31 ||
      t.tm_hour > 23 || t.tm_min > 59 || t.tm_sec > 60)
    return std::nullopt;

  t.tm_year -= 1900;
  t.tm_mon -= 1;

  const char *p = buffer.c_str() + consumed;

  // Fractional seconds, truncated to milliseconds
  uint64_t millis = 0;
  if (*p == '.') {
    p++;
    int digits = 0;
    while (std::isdigit(static_cast<unsigned char>(*p))) {
      if (digits < 3)
        millis = millis * 10 + static_cast<uint64_t>(*p - '0');
      digits++;
      p++;
    }
    if (digits == 0)
      return std::nullopt;
    for (; digits < 3; ++digits)
      millis *= 10;
  }

  // Timezone
  int tz_offset_seconds = 0;
  if (*p == 'Z' || *p == 'z') {
    p++;
  } else if (*p == '+' || *p == '-') {
    char tz_sign = *p++;
    int tz_hour = 0, tz_min = 0;
    if (std::sscanf(p, "%2d:%2d", &tz_hour, &tz_min) != 2 &&
        std::sscanf(p, "%2d%2d", &tz_hour, &tz_min) != 2)
      return std::nullopt;
    tz_offset_seconds = (tz_hour * 3600) + (tz_min * 60);
    if (tz_sign == '-')
      tz_offset_seconds = -tz_offset_seconds;
    while (*p && !std::isspace(static_cast<unsigned char>(*p)))
      p++;
  }

  if (*p != '\0')
    return std::nullopt;

  // timegm treats the tm struct as UTC; shift by the parsed offset afterwards
  std::time_t epoch_seconds = timegm(&t);
  if (epoch_seconds == -1)
    return std::nullopt;

  epoch_seconds -= tz_offset_seconds;
  if (epoch_seconds < 0)
    return std::nullopt;

  return static_cast<uint64_t>(epoch_seconds) * 1000 + millis;
}

std::string format_ms_as_iso8601(uint64_t timestamp_ms) {
  auto time_in_seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm_buf{};
  char time_buffer[32];

  if (gmtime_r(&time_in_seconds, &tm_buf) == nullptr)
    return std::to_string(timestamp_ms);

  std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%dT%H:%M:%S",
                &tm_buf);
  char with_millis[48];
  std::snprintf(with_millis, sizeof(with_millis), "%s.%03uZ", time_buffer,
                static_cast<unsigned>(timestamp_ms % 1000));
  return with_millis;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

} // namespace Utils
