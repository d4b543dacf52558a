#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: step status.
// Workflow replay: lifecycle of one history entry. Only the last entry of a
// log may still be running.
namespace chronicle::schema {

enum class step_status_t : uint8_t { running = 0, completed = 1, failed = 2 };

inline constexpr auto kStepStatusMappings = std::array{
    std::pair<std::string_view, step_status_t>{"running",
                                               step_status_t::running},
    std::pair<std::string_view, step_status_t>{"completed",
                                               step_status_t::completed},
    std::pair<std::string_view, step_status_t>{"failed",
                                               step_status_t::failed}};

template <>
inline std::optional<step_status_t> try_from_string<step_status_t>(
    const std::string_view value) {
  return from_string(value, kStepStatusMappings);
}

inline constexpr std::string_view to_string(const step_status_t value) {
  return to_string(value, kStepStatusMappings).value_or("unknown");
}

}  // namespace chronicle::schema
