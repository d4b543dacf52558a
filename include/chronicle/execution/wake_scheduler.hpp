#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string_view>
#include <thread>
#include <vector>

namespace chronicle::execution {

struct wake_request final {
  chronicle::schema::workflow_id_t workflow_id;
  chronicle::schema::timestamp_milliseconds_t fire_at{};
  uint64_t order{};
};

/// In-memory timer that resumes suspended workflows.
///
/// Requests are ordered by (fire_at, arrival) and fire no earlier than
/// `fire_at` (milliseconds since the system clock epoch). A workflow holds at
/// most one request; scheduling again replaces it. Nothing here is durable:
/// after a restart the engine re-arms wakes from history. A scheduler that
/// has not been started only queues requests.
class wake_scheduler final {
 public:
  using callback_t =
      std::function<void(const chronicle::schema::workflow_id_t&)>;

  explicit wake_scheduler(callback_t callback);
  ~wake_scheduler();

  wake_scheduler(const wake_scheduler&) = delete;
  wake_scheduler& operator=(const wake_scheduler&) = delete;

  void start();
  void stop();
  bool running() const;

  void schedule(const chronicle::schema::workflow_id_t& workflow_id,
                chronicle::schema::timestamp_milliseconds_t fire_at);

  /// Drop the pending request of a workflow; false when there was none.
  bool cancel(std::string_view workflow_id);

  /// Pending requests in firing order.
  std::vector<wake_request> pending() const;

  /// Block until nothing is pending or firing, or `timeout` passes.
  bool wait_idle(std::chrono::milliseconds timeout);

 private:
  struct fire_order final {
    bool operator()(const wake_request& lhs, const wake_request& rhs) const {
      if (lhs.fire_at != rhs.fire_at) {
        return lhs.fire_at < rhs.fire_at;
      }
      return lhs.order < rhs.order;
    }
  };

  void run();
  bool erase_locked(std::string_view workflow_id);

  callback_t callback_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::set<wake_request, fire_order> queue_;
  uint64_t next_order_{};
  std::size_t in_flight_{};
  bool running_{};
  bool stopping_{};
  std::thread thread_;
};

}  // namespace chronicle::execution
