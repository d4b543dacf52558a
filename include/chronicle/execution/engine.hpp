#pragma once

#include <chronicle/execution/registry.hpp>
#include <chronicle/execution/wake_scheduler.hpp>
#include <chronicle/execution/workflow_context.hpp>
#include <chronicle/schema/encoding/encoder.hpp>
#include <chronicle/schema/history_entry.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/run_result.hpp>
#include <chronicle/schema/signal_wait.hpp>
#include <chronicle/schema/workflow_record.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::execution {

/// Runtime knobs of the workflow driver.
struct engine_options final {
  /// Save attempts per flush before a pass is reported as a persistence
  /// failure.
  uint32_t persist_attempts{3};
  std::chrono::milliseconds persist_backoff{50};
  /// Start the wake scheduler thread on construction. When false, wakes are
  /// only queued and resumes must be driven by the caller.
  bool start_scheduler{true};
  /// Milliseconds since epoch; defaults to the system clock.
  clock_fn_t clock;
};

/// Deterministic workflow driver.
///
/// Runs workflow bodies pass by pass. A pass that reaches an unresolved
/// timer or signal wait is unwound, its record is flushed to storage and the
/// wake is handed to the scheduler. Resuming re-runs the body from its entry
/// point; recorded steps are answered from history until execution reaches
/// the point where the previous pass stopped.
class engine final {
 public:
  /// Construct the engine and load every persisted workflow record.
  explicit engine(
      chronicle::schema::encoding::encoder<
          chronicle::schema::encoding::scale_encoder_tag>& encoder,
      chronicle::storage::storage<chronicle::storage::rocksdb_storage_tag>&
          storage,
      activity_registry activities,
      workflow_registry workflows,
      engine_options options = {});

  ~engine();

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Start a new workflow instance of a registered type.
  ///
  /// Fails with `already_exists` when the id is taken and with
  /// `unknown_workflow_type` for an unregistered type; neither mutates
  /// anything.
  chronicle::schema::run_result_t start_workflow(
      std::string_view workflow_id,
      std::string_view workflow_type,
      const chronicle::schema::bytes_t& args);

  /// Re-run a workflow from its entry point over its recorded history.
  ///
  /// Terminal workflows report their recorded outcome without running. A
  /// workflow whose recorded timer has not elapsed yet stays suspended.
  chronicle::schema::run_result_t resume_workflow(std::string_view workflow_id);

  /// Deliver a signal to a workflow's inbox and resume it when it waits for
  /// that signal.
  chronicle::schema::run_result_t signal_workflow(
      std::string_view workflow_id,
      std::string_view signal_name,
      const chronicle::schema::bytes_t& payload);

  /// Cancel a workflow. A running pass stops at its next step boundary.
  chronicle::schema::run_result_t cancel_workflow(std::string_view workflow_id);

  /// Startup protocol: re-arm every non-terminal workflow loaded from
  /// storage. Returns how many workflows were scheduled or resumed.
  std::size_t recover();

  std::optional<chronicle::schema::workflow_record_t> describe(
      std::string_view workflow_id) const;

  std::vector<chronicle::schema::history_entry_t> history(
      std::string_view workflow_id) const;

  std::vector<chronicle::schema::workflow_id_t> list_workflows() const;

  wake_scheduler& scheduler();

 private:
  struct workflow_slot final {
    std::mutex pass_mutex;
    std::atomic<bool> cancel_requested{};
  };

  std::shared_ptr<workflow_slot> slot_for(std::string_view workflow_id);

  /// Drive one pass over a working copy of the record. The pass mutex of the
  /// workflow must be held.
  chronicle::schema::run_result_t run_pass(
      chronicle::schema::workflow_record_t record,
      workflow_slot& slot);

  /// Save with retries; true once storage confirmed the write.
  bool persist(const chronicle::schema::workflow_record_t& record);

  /// Replace the in-memory record after a confirmed save.
  void commit(chronicle::schema::workflow_record_t record);

  std::optional<chronicle::schema::workflow_record_t> find_record(
      std::string_view workflow_id) const;

  /// Wake time of a trailing recorded timer.
  std::optional<chronicle::schema::timestamp_milliseconds_t> pending_timer(
      const chronicle::schema::workflow_record_t& record) const;

  /// Input of a trailing, still running signal wait.
  std::optional<chronicle::schema::signal_wait_t> pending_signal_wait(
      const chronicle::schema::workflow_record_t& record) const;

  /// True when a pass would make progress right now.
  bool ready_to_run(const chronicle::schema::workflow_record_t& record) const;

  chronicle::schema::run_result_t outcome_of(
      const chronicle::schema::workflow_record_t& record) const;

  chronicle::schema::timestamp_milliseconds_t now() const;

  /// Load persisted workflow records from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  chronicle::schema::encoding::encoder<
      chronicle::schema::encoding::scale_encoder_tag>& encoder_;
  chronicle::storage::storage<chronicle::storage::rocksdb_storage_tag>&
      storage_;
  activity_registry activities_;
  workflow_registry workflows_;
  engine_options options_;
  std::map<chronicle::schema::workflow_id_t,
           chronicle::schema::workflow_record_t,
           std::less<>>
      records_;
  std::map<chronicle::schema::workflow_id_t,
           std::shared_ptr<workflow_slot>,
           std::less<>>
      slots_;
  wake_scheduler scheduler_;
};

}  // namespace chronicle::execution
