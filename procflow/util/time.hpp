#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace procflow
{
  using namespace std::chrono_literals;

  using Duration_t = std::chrono::milliseconds;
  using DateClock_t = std::chrono::system_clock;
  using TimePoint_t = DateClock_t::time_point;

  /// wall clock time right now, truncated to whole seconds (the resolution of token claims)
  TimePoint_t
  time_point_now();

  /// range of unix times, in seconds, a TimePoint_t can hold
  inline constexpr int64_t MAX_UNIX_SECONDS =
      std::chrono::duration_cast<std::chrono::seconds>(TimePoint_t::duration::max()).count();
  inline constexpr int64_t MIN_UNIX_SECONDS =
      std::chrono::duration_cast<std::chrono::seconds>(TimePoint_t::duration::min()).count();

  /// the point in time `seconds` after the unix epoch; saturates to TimePoint_t::max()/min()
  /// outside of [MIN_UNIX_SECONDS, MAX_UNIX_SECONDS]
  TimePoint_t
  from_unix_seconds(int64_t seconds);

  // Returns a string such as "27m13s ago" or "in 1h12m" or "now".  You get precision of minutes
  // (for >=1h), seconds (>=10s), or milliseconds.  The `now_threshold` argument controls how close
  // to `now` the time has to be to get the "now" string.
  std::string
  short_time_from(const TimePoint_t& t, const TimePoint_t& now, const Duration_t& now_threshold = 1s);

  // Makes a duration human readable, e.g. "-4h04m12.123s" or "12.500s".
  std::string
  ToString(Duration_t t);

}  // namespace procflow
