#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>

// Schema type: timer input.
// Workflow replay: recorded input of a sleep step; `wake_at` lets a
// restarted process re-arm the wake from history alone.
namespace chronicle::schema {

template <uint16_t Version>
struct timer_input;

template <>
struct timer_input<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t started_at{};
  timestamp_milliseconds_t wake_at{};
};

using timer_input_t = timer_input<1>;

}  // namespace chronicle::schema
