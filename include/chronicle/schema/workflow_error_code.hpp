#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: workflow error code.
// Workflow replay: why a pass or a driver request ended in failure.
namespace chronicle::schema {

enum class workflow_error_code_t : uint8_t {
  none = 0,
  step_failure = 1,
  determinism_violation = 2,
  persistence_failure = 3,
  workflow_error = 4,
  unknown_workflow_type = 5,
  unknown_activity = 6,
  workflow_not_found = 7,
  already_exists = 8,
  cancelled = 9
};

inline constexpr auto kWorkflowErrorCodeMappings = std::array{
    std::pair<std::string_view, workflow_error_code_t>{
        "none", workflow_error_code_t::none},
    std::pair<std::string_view, workflow_error_code_t>{
        "step_failure", workflow_error_code_t::step_failure},
    std::pair<std::string_view, workflow_error_code_t>{
        "determinism_violation", workflow_error_code_t::determinism_violation},
    std::pair<std::string_view, workflow_error_code_t>{
        "persistence_failure", workflow_error_code_t::persistence_failure},
    std::pair<std::string_view, workflow_error_code_t>{
        "workflow_error", workflow_error_code_t::workflow_error},
    std::pair<std::string_view, workflow_error_code_t>{
        "unknown_workflow_type", workflow_error_code_t::unknown_workflow_type},
    std::pair<std::string_view, workflow_error_code_t>{
        "unknown_activity", workflow_error_code_t::unknown_activity},
    std::pair<std::string_view, workflow_error_code_t>{
        "workflow_not_found", workflow_error_code_t::workflow_not_found},
    std::pair<std::string_view, workflow_error_code_t>{
        "already_exists", workflow_error_code_t::already_exists},
    std::pair<std::string_view, workflow_error_code_t>{
        "cancelled", workflow_error_code_t::cancelled}};

template <>
inline std::optional<workflow_error_code_t>
try_from_string<workflow_error_code_t>(const std::string_view value) {
  return from_string(value, kWorkflowErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const workflow_error_code_t value) {
  return to_string(value, kWorkflowErrorCodeMappings).value_or("unknown");
}

}  // namespace chronicle::schema
