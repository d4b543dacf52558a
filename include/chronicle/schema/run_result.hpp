#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/workflow_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: run result.
// Workflow replay: outcome of one driver request (start, resume, signal).
namespace chronicle::schema {

struct completed_t final {
  bytes_t output;
};

struct suspended_t final {
  // Absent while waiting for a signal that has no deadline.
  std::optional<timestamp_milliseconds_t> wake_at;
};

struct failed_t final {
  workflow_error_code_t code{workflow_error_code_t::workflow_error};
  std::string message;
  // History position involved, when the failure is tied to a step.
  std::optional<uint64_t> sequence;
};

using run_result_t = std::variant<completed_t, suspended_t, failed_t>;

inline bool is_completed(const run_result_t& result) {
  return std::holds_alternative<completed_t>(result);
}

inline bool is_suspended(const run_result_t& result) {
  return std::holds_alternative<suspended_t>(result);
}

inline bool is_failed(const run_result_t& result) {
  return std::holds_alternative<failed_t>(result);
}

inline std::string to_string(const run_result_t& result) {
  return std::visit(
      overloaded{
          [](const completed_t& value) -> std::string {
            return "completed (" + std::to_string(value.output.size()) +
                   " byte output)";
          },
          [](const suspended_t& value) -> std::string {
            if (!value.wake_at.has_value()) {
              return "suspended awaiting signal";
            }
            return "suspended until " + std::to_string(*value.wake_at);
          },
          [](const failed_t& value) -> std::string {
            return "failed [" + std::string{to_string(value.code)} +
                   "]: " + value.message;
          }},
      result);
}

}  // namespace chronicle::schema
