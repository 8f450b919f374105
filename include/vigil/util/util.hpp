#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace vigil {

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // RFC 4122 version 4, variant 1
  return std::format(
      "{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a) & 0x0FFFU,
      (static_cast<std::uint16_t>(b >> 48) & 0x3FFFU) | 0x8000U,
      b & 0xFFFFFFFFFFFFULL);
}

[[nodiscard]] inline auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Renders epoch milliseconds as UTC ISO-8601; 0 means "unset" and renders
// as an empty string.
[[nodiscard]] inline auto format_timestamp(std::int64_t ts_ms) -> std::string {
  if (ts_ms <= 0) {
    return {};
  }
  auto time = static_cast<std::time_t>(ts_ms / 1000);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ts_ms % 1000));
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_timestamp(now_ms());
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" offset. Returns epoch milliseconds.
[[nodiscard]] inline auto parse_timestamp(std::string_view text)
    -> std::optional<std::int64_t> {
  std::string s{text};
  int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &mon, &day,
                  &hour, &min, &sec, &consumed) != 6) {
    return std::nullopt;
  }
  if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 ||
      sec > 60) {
    return std::nullopt;
  }

  std::int64_t millis = 0;
  auto pos = static_cast<std::size_t>(consumed);
  if (pos < s.size() && s[pos] == '.') {
    int digits = 0;
    ++pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    while (digits++ < 3) {
      millis *= 10;
    }
  }

  std::int64_t offset_sec = 0;
  if (pos < s.size()) {
    if (s[pos] == 'Z' || s[pos] == 'z') {
      ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
      int oh = 0, om = 0;
      if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
        return std::nullopt;
      }
      offset_sec = (oh * 3600 + om * 60) * (s[pos] == '+' ? 1 : -1);
      pos += 6;
    }
  }
  if (pos != s.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = mon - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  auto epoch = static_cast<std::int64_t>(timegm(&tm));
  return (epoch - offset_sec) * 1000 + millis;
}

}  // namespace vigil
