#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: step kind.
// Workflow replay: which interceptor path produced a history entry.
namespace chronicle::schema {

enum class step_kind_t : uint8_t {
  activity = 0,
  timer = 1,
  signal_received = 2
};

/// Reserved step name recorded for timer entries.
inline constexpr auto kTimerStepName = std::string_view{"sleep"};

inline constexpr auto kStepKindMappings = std::array{
    std::pair<std::string_view, step_kind_t>{"activity",
                                             step_kind_t::activity},
    std::pair<std::string_view, step_kind_t>{"timer", step_kind_t::timer},
    std::pair<std::string_view, step_kind_t>{"signal-received",
                                             step_kind_t::signal_received}};

template <>
inline std::optional<step_kind_t> try_from_string<step_kind_t>(
    const std::string_view value) {
  return from_string(value, kStepKindMappings);
}

inline constexpr std::string_view to_string(const step_kind_t value) {
  return to_string(value, kStepKindMappings).value_or("unknown");
}

}  // namespace chronicle::schema
