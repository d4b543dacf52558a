#pragma once

#include <chronicle/schema/history_entry.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/signal_wait.hpp>
#include <chronicle/schema/workflow_error_code.hpp>
#include <chronicle/schema/workflow_status.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: workflow record.
// Workflow replay: durable unit stored per workflow id. Carries the history
// log together with what a restarted process needs to resume it.
namespace chronicle::schema {

template <uint16_t Version>
struct workflow_record;

template <>
struct workflow_record<1> final {
  uint16_t version{1};
  workflow_id_t workflow_id;
  std::string workflow_type;
  workflow_status_t status{workflow_status_t::not_started};
  bytes_t args;
  std::optional<bytes_t> result;
  workflow_error_code_t error_code{workflow_error_code_t::none};
  std::string error;
  bool cancel_requested{};
  std::vector<pending_signal_t> inbox;
  std::vector<history_entry_t> history;
};

using workflow_record_t = workflow_record<1>;

}  // namespace chronicle::schema
