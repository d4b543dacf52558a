#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/execution/wake_scheduler.hpp>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace {

// Values past what the clock's duration can represent saturate to
// time_point::max() instead of wrapping into the past.
std::chrono::system_clock::time_point to_time_point(
    const chronicle::schema::timestamp_milliseconds_t value) {
  using clock_duration_t = std::chrono::system_clock::duration;
  constexpr auto kMaxMilliseconds = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          clock_duration_t::max())
          .count());
  if (value >= kMaxMilliseconds) {
    return std::chrono::system_clock::time_point::max();
  }
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<clock_duration_t>(std::chrono::milliseconds{
          static_cast<std::chrono::milliseconds::rep>(value)})};
}

}  // namespace

namespace chronicle::execution {

wake_scheduler::wake_scheduler(callback_t callback)
    : callback_{std::move(callback)} {
  if (!callback_) {
    throw std::invalid_argument{"wake_scheduler requires a callback"};
  }
}

wake_scheduler::~wake_scheduler() {
  stop();
}

void wake_scheduler::start() {
  auto lock = std::scoped_lock{mutex_};
  if (running_) {
    return;
  }
  stopping_ = false;
  running_ = true;
  thread_ = std::thread{[this] { run(); }};
  spdlog::debug("Wake scheduler started with {} pending request(s)",
                queue_.size());
}

void wake_scheduler::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (!running_) {
      return;
    }
    stopping_ = true;
  }
  condition_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  auto lock = std::scoped_lock{mutex_};
  running_ = false;
  idle_condition_.notify_all();
  spdlog::debug("Wake scheduler stopped with {} pending request(s)",
                queue_.size());
}

bool wake_scheduler::running() const {
  auto lock = std::scoped_lock{mutex_};
  return running_;
}

void wake_scheduler::schedule(
    const chronicle::schema::workflow_id_t& workflow_id,
    const chronicle::schema::timestamp_milliseconds_t fire_at) {
  {
    auto lock = std::scoped_lock{mutex_};
    erase_locked(workflow_id);
    queue_.insert(wake_request{
        .workflow_id = workflow_id, .fire_at = fire_at, .order = next_order_++});
  }
  spdlog::debug("Scheduled wake for workflow '{}' at {}", workflow_id,
                fire_at);
  condition_.notify_all();
}

bool wake_scheduler::cancel(std::string_view workflow_id) {
  auto erased = false;
  {
    auto lock = std::scoped_lock{mutex_};
    erased = erase_locked(workflow_id);
  }
  if (erased) {
    spdlog::debug("Cancelled wake for workflow '{}'", workflow_id);
    condition_.notify_all();
    idle_condition_.notify_all();
  }
  return erased;
}

std::vector<wake_request> wake_scheduler::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return std::vector<wake_request>{std::begin(queue_), std::end(queue_)};
}

bool wake_scheduler::wait_idle(const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  return idle_condition_.wait_for(lock, timeout, [this] {
    return (queue_.empty() || !running_) && in_flight_ == 0;
  });
}

void wake_scheduler::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    if (queue_.empty()) {
      condition_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      continue;
    }

    auto next = std::begin(queue_);
    const auto fire_at = to_time_point(next->fire_at);
    if (std::chrono::system_clock::now() < fire_at) {
      condition_.wait_until(lock, fire_at);
      continue;
    }

    auto request = *next;
    queue_.erase(next);
    ++in_flight_;
    lock.unlock();
    spdlog::info("Wake fired for workflow '{}'", request.workflow_id);
    try {
      callback_(request.workflow_id);
    } catch (const std::exception& ex) {
      spdlog::error("Wake callback for workflow '{}' failed: {}",
                    request.workflow_id, ex.what());
    } catch (...) {
      spdlog::error("Wake callback for workflow '{}' failed with a "
                    "non-standard exception",
                    request.workflow_id);
    }
    lock.lock();
    --in_flight_;
    idle_condition_.notify_all();
  }
}

bool wake_scheduler::erase_locked(std::string_view workflow_id) {
  auto found = std::find_if(std::begin(queue_), std::end(queue_),
                            [&](const wake_request& request) {
                              return request.workflow_id == workflow_id;
                            });
  if (found == std::end(queue_)) {
    return false;
  }
  queue_.erase(found);
  return true;
}

}  // namespace chronicle::execution
