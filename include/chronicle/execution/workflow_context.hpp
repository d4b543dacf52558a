#pragma once

#include <chronicle/execution/execution_cursor.hpp>
#include <chronicle/execution/registry.hpp>
#include <chronicle/execution/step_failure.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/history_entry.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/workflow_record.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chronicle::execution {

using clock_fn_t = std::function<chronicle::schema::timestamp_milliseconds_t()>;
using wake_fn_t =
    std::function<void(const chronicle::schema::workflow_id_t&,
                       chronicle::schema::timestamp_milliseconds_t)>;

/// Effectful operation with its recorded name and input.
struct activity_step final {
  std::string name;
  chronicle::schema::bytes_t input;
  std::function<chronicle::schema::bytes_t()> operation;
};

/// Durable wait for time to pass.
struct timer_step final {
  chronicle::schema::duration_milliseconds_t duration{};
};

/// Wait for an externally delivered signal, optionally bounded by a timeout.
struct signal_step final {
  std::string name;
  std::optional<chronicle::schema::duration_milliseconds_t> timeout;
};

using step_t = std::variant<activity_step, timer_step, signal_step>;

/// Why the current pass stopped before the workflow body returned.
enum class interrupt_reason_t : uint8_t {
  none = 0,
  suspended = 1,
  determinism_violation = 2,
  cancelled = 3,
  unknown_activity = 4
};

struct pass_interruption final {
  interrupt_reason_t reason{interrupt_reason_t::none};
  std::string message;
  std::optional<uint64_t> sequence;
  std::optional<chronicle::schema::timestamp_milliseconds_t> wake_at;
};

/// What a pass may touch besides the record it drives.
struct pass_environment final {
  const activity_registry& activities;
  clock_fn_t clock;
  // Receives the wake a suspending step asks for.
  wake_fn_t request_wake;
  const std::atomic<bool>* cancel_requested{nullptr};
};

namespace detail {

// Unwinds a workflow body up to the driver. Deliberately not derived from
// std::exception so that `catch (const std::exception&)` in workflow code
// cannot absorb it.
struct pass_interrupted final {};

}  // namespace detail

/// Step interceptor handed to workflow bodies for one execution pass.
///
/// Every step consults the history log at the cursor position first: a
/// recorded outcome is returned (or re-raised) without running the step
/// again, otherwise the step runs live and its outcome is appended. The
/// cursor moves exactly once per step either way.
class workflow_context final {
 public:
  workflow_context(chronicle::schema::workflow_record_t& record,
                   pass_environment environment);

  workflow_context(const workflow_context&) = delete;
  workflow_context& operator=(const workflow_context&) = delete;

  const chronicle::schema::workflow_id_t& workflow_id() const;

  /// Current cursor position.
  uint64_t sequence() const;

  /// True while the cursor is still inside previously recorded history.
  bool replaying() const;

  /// Run one step of any kind through the history log.
  ///
  /// Returns the activity output, the delivered signal payload, or
  /// std::nullopt for a timer and for a signal wait that timed out.
  std::optional<chronicle::schema::bytes_t> invoke(step_t step);

  /// Run a registered activity by name.
  chronicle::schema::bytes_t execute_activity(
      std::string_view name,
      const chronicle::schema::bytes_t& input);

  /// Run an inline operation as a recorded step.
  chronicle::schema::bytes_t step(
      std::string_view name,
      const chronicle::schema::bytes_t& input,
      std::function<chronicle::schema::bytes_t()> operation);

  /// Suspend the workflow until `duration` has elapsed.
  void sleep(chronicle::schema::duration_milliseconds_t duration);
  void sleep(std::chrono::milliseconds duration);

  /// Wait for the signal `name`; std::nullopt when `timeout` elapsed first.
  std::optional<chronicle::schema::bytes_t> wait_for_signal(
      std::string_view name,
      std::optional<chronicle::schema::duration_milliseconds_t> timeout =
          std::nullopt);

  /// Recorded clock reading; replays return the original value.
  chronicle::schema::timestamp_milliseconds_t now();

  /// Typed activity call; input and result travel SCALE encoded.
  template <typename Result, typename Input>
  Result call(std::string_view activity, const Input& input) {
    auto encoder = encoder_t{};
    auto output = execute_activity(activity, encoder.encode(input));
    return encoder.decode<Result>(
        chronicle::schema::bytes_view_t{output.data(), output.size()});
  }

  bool interrupted() const;
  const pass_interruption& interruption() const;

 private:
  using encoder_t = chronicle::schema::encoding::encoder<
      chronicle::schema::encoding::scale_encoder_tag>;

  chronicle::schema::bytes_t run_activity(activity_step& step);
  void run_timer(const timer_step& step);
  std::optional<chronicle::schema::bytes_t> run_signal_wait(
      const signal_step& step);

  /// Entry recorded at the cursor, checked against the invoked step.
  chronicle::schema::history_entry_t* recorded_entry(
      std::string_view name,
      chronicle::schema::step_kind_t kind);

  std::size_t append_entry(std::string_view name,
                           chronicle::schema::step_kind_t kind,
                           chronicle::schema::bytes_t input);

  /// Mark the entry at `index` failed with `message`.
  void fail_entry(std::size_t index, std::string message);

  void check_boundary();

  [[noreturn]] void interrupt(interrupt_reason_t reason,
                              std::string message,
                              std::optional<uint64_t> sequence);

  chronicle::schema::workflow_record_t& record_;
  pass_environment environment_;
  execution_cursor cursor_;
  pass_interruption interruption_;
};

}  // namespace chronicle::execution
