#pragma once

#include "bgcore/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace bgcore {

// -----------------------------------------------------------------------------
// Timestamp <-> epoch milliseconds
// -----------------------------------------------------------------------------
// Events carry Timestamp; domain structs, the wire format and ITimeProvider
// use int64 epoch milliseconds.
// -----------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace bgcore
