#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/execution/workflow_context.hpp>
#include <chronicle/schema/signal_wait.hpp>
#include <chronicle/schema/timer_input.hpp>
#include <iterator>
#include <limits>
#include <utility>

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::encoder<
    chronicle::schema::encoding::scale_encoder_tag>;

constexpr auto kClockStepName = std::string_view{"now"};

// Wake times saturate instead of wrapping to a moment before `base`.
timestamp_milliseconds_t add_saturated(const timestamp_milliseconds_t base,
                                       const duration_milliseconds_t delay) {
  constexpr auto kMax = std::numeric_limits<timestamp_milliseconds_t>::max();
  return delay > kMax - base ? kMax : base + delay;
}

}  // namespace

namespace chronicle::execution {

workflow_context::workflow_context(workflow_record_t& record,
                                   pass_environment environment)
    : record_{record}, environment_{std::move(environment)} {
  cursor_.reset();
}

const workflow_id_t& workflow_context::workflow_id() const {
  return record_.workflow_id;
}

uint64_t workflow_context::sequence() const {
  return cursor_.sequence;
}

bool workflow_context::replaying() const {
  return cursor_.sequence < record_.history.size();
}

bool workflow_context::interrupted() const {
  return interruption_.reason != interrupt_reason_t::none;
}

const pass_interruption& workflow_context::interruption() const {
  return interruption_;
}

std::optional<bytes_t> workflow_context::invoke(step_t step) {
  check_boundary();
  return std::visit(
      overloaded{[&](activity_step& value) -> std::optional<bytes_t> {
                   return run_activity(value);
                 },
                 [&](timer_step& value) -> std::optional<bytes_t> {
                   run_timer(value);
                   return std::nullopt;
                 },
                 [&](signal_step& value) -> std::optional<bytes_t> {
                   return run_signal_wait(value);
                 }},
      step);
}

bytes_t workflow_context::execute_activity(std::string_view name,
                                           const bytes_t& input) {
  check_boundary();
  const auto* activity = environment_.activities.find(name);
  if (activity == nullptr) {
    interrupt(interrupt_reason_t::unknown_activity,
              fmt::format("activity '{}' is not registered", name),
              cursor_.sequence);
  }
  auto bound = [activity, input]() { return (*activity)(input); };
  return invoke(activity_step{.name = std::string{name},
                              .input = input,
                              .operation = std::move(bound)})
      .value_or(bytes_t{});
}

bytes_t workflow_context::step(std::string_view name,
                               const bytes_t& input,
                               std::function<bytes_t()> operation) {
  return invoke(activity_step{.name = std::string{name},
                              .input = input,
                              .operation = std::move(operation)})
      .value_or(bytes_t{});
}

void workflow_context::sleep(const duration_milliseconds_t duration) {
  invoke(timer_step{.duration = duration});
}

void workflow_context::sleep(const std::chrono::milliseconds duration) {
  sleep(static_cast<duration_milliseconds_t>(std::max<int64_t>(
      0, static_cast<int64_t>(duration.count()))));
}

std::optional<bytes_t> workflow_context::wait_for_signal(
    std::string_view name,
    std::optional<duration_milliseconds_t> timeout) {
  return invoke(signal_step{.name = std::string{name}, .timeout = timeout});
}

timestamp_milliseconds_t workflow_context::now() {
  auto encoder = encoder_t{};
  auto output = step(kClockStepName, bytes_t{}, [this]() {
    auto encoder = encoder_t{};
    return encoder.encode(environment_.clock());
  });
  return encoder.decode<timestamp_milliseconds_t>(
      bytes_view_t{output.data(), output.size()});
}

bytes_t workflow_context::run_activity(activity_step& step) {
  const auto position = cursor_.sequence;
  auto index = std::size_t{};
  if (auto* entry = recorded_entry(step.name, step_kind_t::activity)) {
    cursor_.advance();
    switch (entry->status) {
      case step_status_t::completed:
        spdlog::debug("Workflow '{}' step {} '{}' served from history",
                      record_.workflow_id, position, step.name);
        return entry->output.value_or(bytes_t{});
      case step_status_t::failed:
        spdlog::debug("Workflow '{}' step {} '{}' replays recorded failure",
                      record_.workflow_id, position, step.name);
        throw step_failure{entry->step_name, position, entry->error};
      case step_status_t::running:
        // Only the last entry can be running; finish it live.
        index = static_cast<std::size_t>(position);
        break;
    }
  } else {
    cursor_.advance();
    index = append_entry(step.name, step_kind_t::activity, step.input);
  }

  spdlog::debug("Workflow '{}' executing step {} '{}'", record_.workflow_id,
                position, step.name);
  try {
    auto output = step.operation();
    auto& entry = record_.history[index];
    entry.status = step_status_t::completed;
    entry.output = output;
    return output;
  } catch (const detail::pass_interrupted&) {
    throw;
  } catch (const std::exception& ex) {
    fail_entry(index, ex.what());
    throw step_failure{step.name, position, ex.what()};
  } catch (...) {
    constexpr auto kMessage = "non-standard exception";
    fail_entry(index, kMessage);
    throw step_failure{step.name, position, kMessage};
  }
}

void workflow_context::run_timer(const timer_step& step) {
  const auto position = cursor_.sequence;
  if (recorded_entry(kTimerStepName, step_kind_t::timer) != nullptr) {
    // Recorded timers have already elapsed by the time a pass reaches them.
    cursor_.advance();
    spdlog::debug("Workflow '{}' timer {} served from history",
                  record_.workflow_id, position);
    return;
  }
  cursor_.advance();

  auto encoder = encoder_t{};
  const auto now = environment_.clock();
  const auto wake_at = add_saturated(now, step.duration);
  const auto index =
      append_entry(kTimerStepName, step_kind_t::timer,
                   encoder.encode(timer_input_t{.started_at = now,
                                                .wake_at = wake_at}));
  if (environment_.request_wake) {
    environment_.request_wake(record_.workflow_id, wake_at);
  }
  auto& entry = record_.history[index];
  entry.status = step_status_t::completed;
  entry.output.reset();

  spdlog::info("Workflow '{}' sleeping {} ms at step {}, wake at {}",
               record_.workflow_id, step.duration, position, wake_at);
  interruption_.wake_at = wake_at;
  interrupt(interrupt_reason_t::suspended, "timer pending", position);
}

std::optional<bytes_t> workflow_context::run_signal_wait(
    const signal_step& step) {
  const auto position = cursor_.sequence;
  auto encoder = encoder_t{};
  auto index = std::size_t{};
  auto wait = signal_wait_t{};
  if (auto* entry = recorded_entry(step.name, step_kind_t::signal_received)) {
    cursor_.advance();
    if (entry->status == step_status_t::completed) {
      spdlog::debug("Workflow '{}' signal '{}' served from history",
                    record_.workflow_id, step.name);
      return entry->output;
    }
    if (entry->status == step_status_t::failed) {
      throw step_failure{entry->step_name, position, entry->error};
    }
    index = static_cast<std::size_t>(position);
    auto decoded = encoder.try_decode<signal_wait_t>(
        bytes_view_t{entry->input.data(), entry->input.size()});
    if (decoded.has_value()) {
      wait = decoded.value();
    }
  } else {
    cursor_.advance();
    wait.started_at = environment_.clock();
    if (step.timeout.has_value()) {
      wait.deadline = add_saturated(wait.started_at, *step.timeout);
    }
    index = append_entry(step.name, step_kind_t::signal_received,
                         encoder.encode(wait));
  }

  auto& inbox = record_.inbox;
  auto delivered =
      std::find_if(std::begin(inbox), std::end(inbox),
                   [&](const pending_signal_t& signal) {
                     return signal.name == step.name;
                   });
  if (delivered != std::end(inbox)) {
    auto payload = delivered->payload;
    inbox.erase(delivered);
    auto& entry = record_.history[index];
    entry.status = step_status_t::completed;
    entry.output = payload;
    spdlog::info("Workflow '{}' received signal '{}' at step {}",
                 record_.workflow_id, step.name, position);
    return payload;
  }

  if (wait.deadline.has_value() && environment_.clock() >= *wait.deadline) {
    auto& entry = record_.history[index];
    entry.status = step_status_t::completed;
    entry.output.reset();
    spdlog::info("Workflow '{}' wait for signal '{}' timed out at step {}",
                 record_.workflow_id, step.name, position);
    return std::nullopt;
  }

  if (wait.deadline.has_value() && environment_.request_wake) {
    environment_.request_wake(record_.workflow_id, *wait.deadline);
  }
  spdlog::info("Workflow '{}' waiting for signal '{}' at step {}",
               record_.workflow_id, step.name, position);
  interruption_.wake_at = wait.deadline;
  interrupt(interrupt_reason_t::suspended, "waiting for signal", position);
}

history_entry_t* workflow_context::recorded_entry(std::string_view name,
                                                  step_kind_t kind) {
  const auto position = cursor_.sequence;
  if (position >= record_.history.size()) {
    return nullptr;
  }
  auto& entry = record_.history[static_cast<std::size_t>(position)];
  if (entry.step_name != name || entry.kind != kind) {
    interrupt(interrupt_reason_t::determinism_violation,
              fmt::format("history position {} recorded {} '{}' but the "
                          "workflow invoked {} '{}'",
                          position, to_string(entry.kind), entry.step_name,
                          to_string(kind), name),
              position);
  }
  return &entry;
}

void workflow_context::fail_entry(const std::size_t index,
                                  std::string message) {
  auto& entry = record_.history[index];
  entry.status = step_status_t::failed;
  entry.error = std::move(message);
  spdlog::warn("Workflow '{}' step {} '{}' failed: {}", record_.workflow_id,
               entry.sequence, entry.step_name, entry.error);
}

std::size_t workflow_context::append_entry(std::string_view name,
                                           step_kind_t kind,
                                           bytes_t input) {
  auto& history = record_.history;
  history.push_back(history_entry_t{.workflow_id = record_.workflow_id,
                                    .sequence = history.size(),
                                    .step_name = std::string{name},
                                    .kind = kind,
                                    .status = step_status_t::running,
                                    .input = std::move(input)});
  return history.size() - 1;
}

void workflow_context::check_boundary() {
  if (interrupted()) {
    throw detail::pass_interrupted{};
  }
  if (environment_.cancel_requested != nullptr &&
      environment_.cancel_requested->load()) {
    interrupt(interrupt_reason_t::cancelled, "workflow cancelled",
              cursor_.sequence);
  }
}

void workflow_context::interrupt(interrupt_reason_t reason,
                                 std::string message,
                                 std::optional<uint64_t> sequence) {
  interruption_.reason = reason;
  interruption_.message = std::move(message);
  interruption_.sequence = sequence;
  throw detail::pass_interrupted{};
}

}  // namespace chronicle::execution
