#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace chronicle::execution {

/// Raised into a workflow body when a step's operation failed, either live
/// or replayed from a `failed` history entry. Workflows may catch it and
/// retry the step, which records a new history position.
class step_failure final : public std::runtime_error {
 public:
  step_failure(std::string step_name,
               uint64_t sequence,
               const std::string& message)
      : std::runtime_error{message},
        step_name_{std::move(step_name)},
        sequence_{sequence} {}

  const std::string& step_name() const { return step_name_; }
  uint64_t sequence() const { return sequence_; }

 private:
  std::string step_name_;
  uint64_t sequence_{};
};

}  // namespace chronicle::execution
