#ifndef TRENDLOOP_CORE_TIME_UTILS_HPP_
#define TRENDLOOP_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace trendloop::core {

namespace detail {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

inline int MillisComponent(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  return static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);
}

} // namespace detail

// Canonical UTC timestamp formatter used by reports, events and logs.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp) << 'Z';
  return out.str();
}

// Filesystem-safe UTC stamp (`20260101_093000_123`) used for snapshot and
// quarantine entry names. Lexicographic order matches chronological order.
inline std::string FormatCompactUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0')
      << detail::MillisComponent(timestamp);
  return out.str();
}

inline std::string FormatFixedDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point FromEpochMilliseconds(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(epoch_ms));
}

} // namespace trendloop::core

#endif // TRENDLOOP_CORE_TIME_UTILS_HPP_
