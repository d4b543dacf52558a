#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/execution/engine.hpp>
#include <chronicle/schema/timer_input.hpp>
#include <iterator>
#include <thread>
#include <utility>

using namespace chronicle::schema;

namespace {

timestamp_milliseconds_t system_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

failed_t not_found(std::string_view workflow_id) {
  return failed_t{.code = workflow_error_code_t::workflow_not_found,
                  .message = "workflow '" + std::string{workflow_id} +
                             "' does not exist"};
}

failed_t persistence_failure(std::string_view workflow_id) {
  return failed_t{.code = workflow_error_code_t::persistence_failure,
                  .message = "record of workflow '" +
                             std::string{workflow_id} +
                             "' could not be saved; last durable state kept"};
}

}  // namespace

namespace chronicle::execution {

engine::engine(chronicle::schema::encoding::encoder<
                   chronicle::schema::encoding::scale_encoder_tag>& encoder,
               chronicle::storage::storage<
                   chronicle::storage::rocksdb_storage_tag>& storage,
               activity_registry activities,
               workflow_registry workflows,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      activities_{std::move(activities)},
      workflows_{std::move(workflows)},
      options_{std::move(options)},
      scheduler_{[this](const workflow_id_t& workflow_id) {
        auto result = resume_workflow(workflow_id);
        spdlog::info("Wake of workflow '{}' finished: {}", workflow_id,
                     to_string(result));
      }} {
  if (!options_.clock) {
    options_.clock = system_now;
  }
  if (options_.persist_attempts == 0) {
    spdlog::warn("persist_attempts is 0; using a single attempt");
    options_.persist_attempts = 1;
  }
  load_persisted_state();
  if (options_.start_scheduler) {
    scheduler_.start();
  }
  spdlog::info(
      "Workflow engine ready with {} record(s), {} workflow type(s), {} "
      "activity(ies)",
      records_.size(), workflows_.types().size(), activities_.names().size());
}

engine::~engine() {
  scheduler_.stop();
}

run_result_t engine::start_workflow(std::string_view workflow_id,
                                    std::string_view workflow_type,
                                    const bytes_t& args) {
  if (workflows_.find(workflow_type) == nullptr) {
    spdlog::warn("Refusing to start '{}': workflow type '{}' is not registered",
                 workflow_id, workflow_type);
    return failed_t{.code = workflow_error_code_t::unknown_workflow_type,
                    .message = "workflow type '" + std::string{workflow_type} +
                               "' is not registered"};
  }
  auto already_exists = [&]() -> run_result_t {
    spdlog::warn("Refusing to start '{}': workflow already exists",
                 workflow_id);
    return failed_t{.code = workflow_error_code_t::already_exists,
                    .message = "workflow '" + std::string{workflow_id} +
                               "' already exists"};
  };
  if (find_record(workflow_id).has_value()) {
    return already_exists();
  }

  auto slot = slot_for(workflow_id);
  auto pass_lock = std::scoped_lock{slot->pass_mutex};
  if (find_record(workflow_id).has_value()) {
    return already_exists();
  }
  slot->cancel_requested = false;

  auto record = workflow_record_t{};
  record.workflow_id = std::string{workflow_id};
  record.workflow_type = std::string{workflow_type};
  record.args = args;
  spdlog::info("Starting workflow '{}' of type '{}'", workflow_id,
               workflow_type);
  return run_pass(std::move(record), *slot);
}

run_result_t engine::resume_workflow(std::string_view workflow_id) {
  if (!find_record(workflow_id).has_value()) {
    return not_found(workflow_id);
  }
  auto slot = slot_for(workflow_id);
  auto pass_lock = std::scoped_lock{slot->pass_mutex};
  auto record = find_record(workflow_id);
  if (!record.has_value()) {
    return not_found(workflow_id);
  }
  if (is_terminal(record->status)) {
    spdlog::debug("Workflow '{}' is already {}; nothing to resume",
                  workflow_id, to_string(record->status));
    return outcome_of(*record);
  }
  if (!ready_to_run(*record)) {
    auto outcome = outcome_of(*record);
    if (const auto* suspended = std::get_if<suspended_t>(&outcome);
        suspended != nullptr && suspended->wake_at.has_value()) {
      spdlog::debug("Workflow '{}' is not due until {}", workflow_id,
                    *suspended->wake_at);
      scheduler_.schedule(record->workflow_id, *suspended->wake_at);
    }
    return outcome;
  }

  slot->cancel_requested = record->cancel_requested;
  spdlog::info("Resuming workflow '{}' over {} recorded step(s)", workflow_id,
               record->history.size());
  return run_pass(std::move(*record), *slot);
}

run_result_t engine::signal_workflow(std::string_view workflow_id,
                                     std::string_view signal_name,
                                     const bytes_t& payload) {
  if (!find_record(workflow_id).has_value()) {
    return not_found(workflow_id);
  }
  auto slot = slot_for(workflow_id);
  auto pass_lock = std::scoped_lock{slot->pass_mutex};
  auto record = find_record(workflow_id);
  if (!record.has_value()) {
    return not_found(workflow_id);
  }
  if (is_terminal(record->status)) {
    spdlog::warn("Dropping signal '{}' for workflow '{}': already {}",
                 signal_name, workflow_id, to_string(record->status));
    return outcome_of(*record);
  }

  record->inbox.push_back(pending_signal_t{.name = std::string{signal_name},
                                           .payload = payload,
                                           .received_at = now()});
  if (!persist(*record)) {
    return persistence_failure(workflow_id);
  }
  commit(*record);
  spdlog::info("Workflow '{}' received signal '{}' ({} pending)", workflow_id,
               signal_name, record->inbox.size());

  auto wait = pending_signal_wait(*record);
  if (!wait.has_value() || record->history.back().step_name != signal_name) {
    return outcome_of(*record);
  }
  slot->cancel_requested = record->cancel_requested;
  return run_pass(std::move(*record), *slot);
}

run_result_t engine::cancel_workflow(std::string_view workflow_id) {
  if (!find_record(workflow_id).has_value()) {
    return not_found(workflow_id);
  }
  auto slot = slot_for(workflow_id);
  slot->cancel_requested = true;
  auto pass_lock = std::scoped_lock{slot->pass_mutex};
  auto record = find_record(workflow_id);
  if (!record.has_value()) {
    return not_found(workflow_id);
  }
  if (is_terminal(record->status)) {
    return outcome_of(*record);
  }

  record->cancel_requested = true;
  record->status = workflow_status_t::cancelled;
  record->error_code = workflow_error_code_t::cancelled;
  record->error = "cancelled by request";
  if (!persist(*record)) {
    slot->cancel_requested = false;
    return persistence_failure(workflow_id);
  }
  scheduler_.cancel(workflow_id);
  auto outcome = outcome_of(*record);
  commit(std::move(*record));
  spdlog::info("Workflow '{}' cancelled", workflow_id);
  return outcome;
}

std::size_t engine::recover() {
  auto snapshot = std::vector<workflow_record_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    snapshot.reserve(records_.size());
    for (const auto& [workflow_id, record] : records_) {
      if (!is_terminal(record.status)) {
        snapshot.push_back(record);
      }
    }
  }

  auto rearmed = std::size_t{};
  auto resume_now = [&](const workflow_record_t& record) {
    auto result = resume_workflow(record.workflow_id);
    spdlog::info("Recovered workflow '{}': {}", record.workflow_id,
                 to_string(result));
    ++rearmed;
  };
  for (const auto& record : snapshot) {
    if (auto wake_at = pending_timer(record)) {
      spdlog::info("Re-arming timer of workflow '{}' for {}",
                   record.workflow_id, *wake_at);
      scheduler_.schedule(record.workflow_id, *wake_at);
      ++rearmed;
      continue;
    }
    if (auto wait = pending_signal_wait(record)) {
      if (ready_to_run(record)) {
        resume_now(record);
      } else if (wait->deadline.has_value()) {
        spdlog::info("Re-arming signal deadline of workflow '{}' for {}",
                     record.workflow_id, *wait->deadline);
        scheduler_.schedule(record.workflow_id, *wait->deadline);
        ++rearmed;
      } else {
        spdlog::info("Workflow '{}' stays idle until signal '{}' arrives",
                     record.workflow_id, record.history.back().step_name);
      }
      continue;
    }
    resume_now(record);
  }
  spdlog::info("Recovery re-armed {} of {} unfinished workflow(s)", rearmed,
               snapshot.size());
  return rearmed;
}

std::optional<workflow_record_t> engine::describe(
    std::string_view workflow_id) const {
  return find_record(workflow_id);
}

std::vector<history_entry_t> engine::history(
    std::string_view workflow_id) const {
  auto record = find_record(workflow_id);
  if (!record.has_value()) {
    return {};
  }
  return record->history;
}

std::vector<workflow_id_t> engine::list_workflows() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<workflow_id_t>{};
  out.reserve(records_.size());
  for (const auto& [workflow_id, record] : records_) {
    out.push_back(workflow_id);
  }
  return out;
}

wake_scheduler& engine::scheduler() {
  return scheduler_;
}

std::shared_ptr<engine::workflow_slot> engine::slot_for(
    std::string_view workflow_id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = slots_.find(workflow_id);
  if (found != std::end(slots_)) {
    return found->second;
  }
  auto slot = std::make_shared<workflow_slot>();
  slots_.emplace(std::string{workflow_id}, slot);
  return slot;
}

run_result_t engine::run_pass(workflow_record_t record, workflow_slot& slot) {
  const auto* workflow = workflows_.find(record.workflow_type);
  if (workflow == nullptr) {
    spdlog::error("Workflow '{}' has unregistered type '{}'",
                  record.workflow_id, record.workflow_type);
    return failed_t{.code = workflow_error_code_t::unknown_workflow_type,
                    .message = "workflow type '" + record.workflow_type +
                               "' is not registered"};
  }

  record.status = workflow_status_t::running;
  auto requested_wake = std::optional<timestamp_milliseconds_t>{};
  auto context = workflow_context{
      record, pass_environment{
                  .activities = activities_,
                  .clock = [this]() { return now(); },
                  .request_wake =
                      [&requested_wake](const workflow_id_t&,
                                        const timestamp_milliseconds_t at) {
                        requested_wake = at;
                      },
                  .cancel_requested = &slot.cancel_requested}};

  auto result = run_result_t{};
  try {
    auto output = (*workflow)(context, record.args);
    if (!context.interrupted()) {
      record.status = workflow_status_t::completed;
      record.result = output;
      record.error_code = workflow_error_code_t::none;
      record.error.clear();
      result = completed_t{.output = std::move(output)};
    }
  } catch (const detail::pass_interrupted&) {
    // Reason is held by the context.
  } catch (const step_failure& ex) {
    if (!context.interrupted()) {
      record.status = workflow_status_t::failed;
      record.error_code = workflow_error_code_t::step_failure;
      record.error = ex.what();
      result = failed_t{.code = workflow_error_code_t::step_failure,
                        .message = ex.what(),
                        .sequence = ex.sequence()};
    }
  } catch (const std::exception& ex) {
    if (!context.interrupted()) {
      record.status = workflow_status_t::failed;
      record.error_code = workflow_error_code_t::workflow_error;
      record.error = ex.what();
      result = failed_t{.code = workflow_error_code_t::workflow_error,
                        .message = ex.what()};
    }
  } catch (...) {
    if (!context.interrupted()) {
      record.status = workflow_status_t::failed;
      record.error_code = workflow_error_code_t::workflow_error;
      record.error = "workflow threw a non-standard exception";
      result = failed_t{.code = workflow_error_code_t::workflow_error,
                        .message = record.error};
    }
  }

  if (context.interrupted()) {
    const auto& interruption = context.interruption();
    switch (interruption.reason) {
      case interrupt_reason_t::suspended:
        record.status = workflow_status_t::suspended;
        result = suspended_t{.wake_at = interruption.wake_at};
        break;
      case interrupt_reason_t::determinism_violation:
        // History and status stay as they were; fixing the workflow code and
        // resuming again is up to the operator.
        spdlog::error("Determinism violation in workflow '{}': {}",
                      record.workflow_id, interruption.message);
        return failed_t{.code = workflow_error_code_t::determinism_violation,
                        .message = interruption.message,
                        .sequence = interruption.sequence};
      case interrupt_reason_t::cancelled:
        record.status = workflow_status_t::cancelled;
        record.cancel_requested = true;
        record.error_code = workflow_error_code_t::cancelled;
        record.error = interruption.message;
        result = failed_t{.code = workflow_error_code_t::cancelled,
                          .message = interruption.message,
                          .sequence = interruption.sequence};
        break;
      case interrupt_reason_t::unknown_activity:
        record.status = workflow_status_t::failed;
        record.error_code = workflow_error_code_t::unknown_activity;
        record.error = interruption.message;
        result = failed_t{.code = workflow_error_code_t::unknown_activity,
                          .message = interruption.message,
                          .sequence = interruption.sequence};
        break;
      case interrupt_reason_t::none:
        break;
    }
  }

  if (!persist(record)) {
    return persistence_failure(record.workflow_id);
  }
  spdlog::info("Workflow '{}' pass ended after {} step(s): {}",
               record.workflow_id, context.sequence(), to_string(result));
  // Committed before the wake is handed over so that a wake firing at once
  // finds the record.
  const auto wake_workflow =
      record.status == workflow_status_t::suspended && requested_wake.has_value();
  auto workflow_id = record.workflow_id;
  commit(std::move(record));
  if (wake_workflow) {
    scheduler_.schedule(workflow_id, *requested_wake);
  }
  return result;
}

bool engine::persist(const workflow_record_t& record) {
  for (auto attempt = uint32_t{1}; attempt <= options_.persist_attempts;
       ++attempt) {
    if (storage_.save_workflow(record)) {
      return true;
    }
    spdlog::warn("Saving workflow '{}' failed (attempt {}/{})",
                 record.workflow_id, attempt, options_.persist_attempts);
    if (attempt < options_.persist_attempts) {
      std::this_thread::sleep_for(options_.persist_backoff);
    }
  }
  spdlog::error("Giving up saving workflow '{}'; it is not durable",
                record.workflow_id);
  return false;
}

void engine::commit(workflow_record_t record) {
  auto lock = std::scoped_lock{mutex_};
  auto workflow_id = record.workflow_id;
  records_.insert_or_assign(std::move(workflow_id), std::move(record));
}

std::optional<workflow_record_t> engine::find_record(
    std::string_view workflow_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = records_.find(workflow_id);
  if (found == std::end(records_)) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<timestamp_milliseconds_t> engine::pending_timer(
    const workflow_record_t& record) const {
  if (record.status != workflow_status_t::suspended ||
      record.history.empty()) {
    return std::nullopt;
  }
  const auto& last = record.history.back();
  if (last.kind != step_kind_t::timer ||
      last.status != step_status_t::completed) {
    return std::nullopt;
  }
  auto input = encoder_.try_decode<timer_input_t>(
      bytes_view_t{last.input.data(), last.input.size()});
  if (!input.has_value()) {
    spdlog::warn("Timer input of workflow '{}' at step {} is not decodable",
                 record.workflow_id, last.sequence);
    return std::nullopt;
  }
  return input->wake_at;
}

std::optional<signal_wait_t> engine::pending_signal_wait(
    const workflow_record_t& record) const {
  if (record.history.empty()) {
    return std::nullopt;
  }
  const auto& last = record.history.back();
  if (last.kind != step_kind_t::signal_received ||
      last.status != step_status_t::running) {
    return std::nullopt;
  }
  auto input = encoder_.try_decode<signal_wait_t>(
      bytes_view_t{last.input.data(), last.input.size()});
  if (!input.has_value()) {
    return signal_wait_t{};
  }
  return input;
}

bool engine::ready_to_run(const workflow_record_t& record) const {
  if (auto wake_at = pending_timer(record)) {
    return *wake_at <= now();
  }
  if (auto wait = pending_signal_wait(record)) {
    const auto& name = record.history.back().step_name;
    auto delivered = std::any_of(
        std::begin(record.inbox), std::end(record.inbox),
        [&](const pending_signal_t& signal) { return signal.name == name; });
    return delivered ||
           (wait->deadline.has_value() && *wait->deadline <= now());
  }
  return true;
}

run_result_t engine::outcome_of(const workflow_record_t& record) const {
  switch (record.status) {
    case workflow_status_t::completed:
      return completed_t{.output = record.result.value_or(bytes_t{})};
    case workflow_status_t::failed:
    case workflow_status_t::cancelled:
      return failed_t{.code = record.error_code, .message = record.error};
    default:
      break;
  }
  if (auto wake_at = pending_timer(record)) {
    return suspended_t{.wake_at = wake_at};
  }
  if (auto wait = pending_signal_wait(record)) {
    return suspended_t{.wake_at = wait->deadline};
  }
  return suspended_t{};
}

timestamp_milliseconds_t engine::now() const {
  return options_.clock();
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted workflow records");
  auto lock = std::scoped_lock{mutex_};
  for (auto& [workflow_id, record] : storage_.load_workflows()) {
    records_.insert_or_assign(workflow_id, std::move(record));
  }
}

}  // namespace chronicle::execution
