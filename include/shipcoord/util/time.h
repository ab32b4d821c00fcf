#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace shipcoord {

// Wall-clock milliseconds since the Unix epoch. Stage deadlines are absolute
// values on this clock.
using TimeMs = std::int64_t;

inline TimeMs wall_clock_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline TimeMs seconds_to_ms(double seconds) { return static_cast<TimeMs>(seconds * 1000.0 + 0.5); }

// Format a remaining duration as "M:SS" for countdown labels. Negative values clamp to 0.
inline std::string format_countdown(TimeMs remaining_ms) {
  if (remaining_ms < 0) remaining_ms = 0;
  const std::int64_t total_s = (remaining_ms + 999) / 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld", static_cast<long long>(total_s / 60),
                static_cast<long long>(total_s % 60));
  return std::string(buf);
}

} // namespace shipcoord
