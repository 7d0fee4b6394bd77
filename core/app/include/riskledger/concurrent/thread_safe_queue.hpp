#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace riskledger {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — unbounded MPSC hand-off queue
// -----------------------------------------------------------------------------
//
// @brief  Mutex-guarded queue used to move telemetry events from the thread
//         that produced them (whoever called ExecutionController::submit)
//         to the IpcServer thread.
//
// @details
// Producers call push() and never block on I/O: JSON formatting and the
// ZeroMQ send happen on the consumer side. The consumer never waits on the
// queue; IpcServer empties it with try_pop() between command polls, and
// the command socket's receive timeout paces the loop.
//
// Non-copyable, non-movable: the mutex is a member.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(value));
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> queue_;
};

}  // namespace riskledger
