#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: signal wait.
// Workflow replay: recorded input of a wait-for-signal step, plus the
// delivered-but-unconsumed signal kept in a workflow's inbox.
namespace chronicle::schema {

template <uint16_t Version>
struct signal_wait;

template <>
struct signal_wait<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t started_at{};
  std::optional<timestamp_milliseconds_t> deadline;
};

using signal_wait_t = signal_wait<1>;

template <uint16_t Version>
struct pending_signal;

template <>
struct pending_signal<1> final {
  uint16_t version{1};
  std::string name;
  bytes_t payload;
  timestamp_milliseconds_t received_at{};
};

using pending_signal_t = pending_signal<1>;

}  // namespace chronicle::schema
