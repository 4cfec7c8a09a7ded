#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>
#include <thread>

#include "mpos/common/logger.hpp"

namespace mpos::runtime {

// Task queue drained by the UI thread.
//
// Any thread may Post(); only the owning thread (the one that constructed the
// queue) runs RunPending(). Tasks posted while a drain is in progress run in
// the next drain, so a task that re-posts itself cannot starve the loop.
// The queue is bounded: a Post beyond capacity is dropped and counted.
// Close() detaches the queue from its logger; afterwards every Post is
// refused without logging, so handles held by worker threads stay safe once
// the owner and its logger are gone.
class UiThread {
 public:
  using Task = std::function<void()>;

  static constexpr size_t kDefaultCapacity = 64;

  explicit UiThread(Logger& logger, size_t capacity = kDefaultCapacity);

  UiThread(const UiThread&) = delete;
  UiThread& operator=(const UiThread&) = delete;
  UiThread(UiThread&&) = delete;
  UiThread& operator=(UiThread&&) = delete;

  // Thread-safe. Returns false when the task was dropped (queue full or
  // closed).
  auto Post(Task task) -> bool;

  // UI thread only. Runs every task queued before the call; returns how many
  // ran. If a task throws, the tasks behind it go back to the front of the
  // queue and the exception propagates.
  auto RunPending() -> size_t;

  // Discards queued tasks and refuses later posts. Thread-safe, idempotent.
  void Close();

  [[nodiscard]] auto IsUiThread() const -> bool;
  [[nodiscard]] auto IsClosed() const -> bool;
  [[nodiscard]] auto HasPending() const -> bool;
  [[nodiscard]] auto Size() const -> size_t;
  [[nodiscard]] auto DroppedCount() const -> uint32_t;
  [[nodiscard]] auto StaleCount() const -> uint32_t;

  void SetCapacity(size_t capacity);

  // Counts an update discarded because its activity lost the foreground or
  // was destroyed. Thread-safe.
  void RecordStaleUpdate(std::string_view owner);

 private:
  std::thread::id owner_;

  mutable std::mutex mutex_;
  // Null once closed. Only dereferenced under mutex_.
  Logger* logger_;
  std::deque<Task> queue_;
  size_t capacity_;
  uint32_t dropped_ = 0;
  uint32_t stale_ = 0;
  bool draining_ = false;
};

}  // namespace mpos::runtime
