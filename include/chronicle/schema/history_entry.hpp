#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/step_kind.hpp>
#include <chronicle/schema/step_status.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: history entry.
// Workflow replay: outcome of one step at one position of a workflow's
// history log. Entries are appended in invocation order and never reordered.
namespace chronicle::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  workflow_id_t workflow_id;
  uint64_t sequence{};
  std::string step_name;
  step_kind_t kind{step_kind_t::activity};
  step_status_t status{step_status_t::running};
  bytes_t input;
  // Present only once completed; a completed timer has none.
  std::optional<bytes_t> output;
  std::string error;
};

using history_entry_t = history_entry<1>;

}  // namespace chronicle::schema
