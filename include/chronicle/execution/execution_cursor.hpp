#pragma once

#include <cstdint>

namespace chronicle::execution {

/// Position of the current pass within a workflow's history log.
///
/// Equals the number of steps the pass has invoked so far, including the
/// one currently consulting the log. Reset at the start of every pass and
/// never persisted.
struct execution_cursor final {
  uint64_t sequence{};

  void reset() { sequence = 0; }

  /// Claim the current position and move past it.
  uint64_t advance() { return sequence++; }
};

}  // namespace chronicle::execution
