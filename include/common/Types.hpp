#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sessiondb::common {

/// Wall-clock instant used for all session timestamps.
using TimePoint = std::chrono::system_clock::time_point;

/// Opaque attribute payload as stored in the ATTRIBUTE_BYTES column (bytea).
using Bytes = std::basic_string<std::byte>;

/// Source of the current time. Injected so expiry can be evaluated against
/// a controlled clock.
using ClockFn = std::function<TimePoint()>;

/// Default clock: std::chrono::system_clock::now.
inline TimePoint systemNow() { return std::chrono::system_clock::now(); }

/// Milliseconds since the Unix epoch, the persisted representation of every
/// timestamp column.
inline int64_t toEpochMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
      .count();
}

inline TimePoint fromEpochMillis(int64_t iMillis) {
  return TimePoint(std::chrono::milliseconds(iMillis));
}

}  // namespace sessiondb::common
