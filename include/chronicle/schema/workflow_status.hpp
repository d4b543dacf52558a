#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: workflow status.
// Workflow replay: driver state of one workflow instance. Suspended exists
// only as a persisted record; no process needs to hold it.
namespace chronicle::schema {

enum class workflow_status_t : uint8_t {
  not_started = 0,
  running = 1,
  suspended = 2,
  completed = 3,
  failed = 4,
  cancelled = 5
};

inline constexpr auto kWorkflowStatusMappings = std::array{
    std::pair<std::string_view, workflow_status_t>{
        "not_started", workflow_status_t::not_started},
    std::pair<std::string_view, workflow_status_t>{"running",
                                                   workflow_status_t::running},
    std::pair<std::string_view, workflow_status_t>{
        "suspended", workflow_status_t::suspended},
    std::pair<std::string_view, workflow_status_t>{
        "completed", workflow_status_t::completed},
    std::pair<std::string_view, workflow_status_t>{"failed",
                                                   workflow_status_t::failed},
    std::pair<std::string_view, workflow_status_t>{
        "cancelled", workflow_status_t::cancelled}};

template <>
inline std::optional<workflow_status_t> try_from_string<workflow_status_t>(
    const std::string_view value) {
  return from_string(value, kWorkflowStatusMappings);
}

inline constexpr std::string_view to_string(const workflow_status_t value) {
  return to_string(value, kWorkflowStatusMappings).value_or("unknown");
}

/// True once the workflow can no longer execute steps.
inline constexpr bool is_terminal(const workflow_status_t value) {
  return value == workflow_status_t::completed ||
         value == workflow_status_t::failed ||
         value == workflow_status_t::cancelled;
}

}  // namespace chronicle::schema
