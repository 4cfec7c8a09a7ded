#include "mpos/runtime/ui_thread.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>

#include "mpos/common/internal_error.hpp"

namespace mpos::runtime {

namespace {

constexpr std::string_view kTag = "ui";

// Clears the draining flag for the lifetime of one RunPending call.
class DrainGuard {
 public:
  explicit DrainGuard(bool& draining) : draining_(draining) {
    draining_ = true;
  }
  ~DrainGuard() {
    draining_ = false;
  }

  DrainGuard(const DrainGuard&) = delete;
  DrainGuard& operator=(const DrainGuard&) = delete;
  DrainGuard(DrainGuard&&) = delete;
  DrainGuard& operator=(DrainGuard&&) = delete;

 private:
  bool& draining_;
};

}  // namespace

UiThread::UiThread(Logger& logger, size_t capacity)
    : owner_(std::this_thread::get_id()),
      logger_(&logger),
      capacity_(capacity) {
}

auto UiThread::Post(Task task) -> bool {
  if (!task) {
    return false;
  }

  std::lock_guard lock(mutex_);
  if (logger_ == nullptr) {
    return false;
  }
  if (queue_.size() >= capacity_) {
    ++dropped_;
    logger_->Error(
        kTag, "queue overflow, dropping task (size: {}, dropped: {})",
        queue_.size(), dropped_);
    return false;
  }
  queue_.push_back(std::move(task));
  logger_->Trace(kTag, "queued task (size: {})", queue_.size());
  return true;
}

auto UiThread::RunPending() -> size_t {
  if (!IsUiThread()) {
    common::ThrowInternalError(
        "UiThread::RunPending", "called from a thread other than the UI thread");
  }
  if (draining_) {
    return 0;
  }
  DrainGuard guard(draining_);

  std::deque<Task> tasks;
  {
    std::lock_guard lock(mutex_);
    tasks.swap(queue_);
  }

  size_t ran = 0;
  try {
    while (!tasks.empty()) {
      Task task = std::move(tasks.front());
      tasks.pop_front();
      task();
      ++ran;
    }
  } catch (...) {
    std::lock_guard lock(mutex_);
    if (logger_ != nullptr) {
      queue_.insert(
          queue_.begin(), std::make_move_iterator(tasks.begin()),
          std::make_move_iterator(tasks.end()));
      logger_->Error(
          kTag, "task threw after {} ran; {} requeued", ran, tasks.size());
    }
    throw;
  }
  return ran;
}

void UiThread::Close() {
  std::lock_guard lock(mutex_);
  queue_.clear();
  logger_ = nullptr;
}

auto UiThread::IsClosed() const -> bool {
  std::lock_guard lock(mutex_);
  return logger_ == nullptr;
}

auto UiThread::IsUiThread() const -> bool {
  return std::this_thread::get_id() == owner_;
}

auto UiThread::HasPending() const -> bool {
  std::lock_guard lock(mutex_);
  return !queue_.empty();
}

auto UiThread::Size() const -> size_t {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

auto UiThread::DroppedCount() const -> uint32_t {
  std::lock_guard lock(mutex_);
  return dropped_;
}

auto UiThread::StaleCount() const -> uint32_t {
  std::lock_guard lock(mutex_);
  return stale_;
}

void UiThread::SetCapacity(size_t capacity) {
  std::lock_guard lock(mutex_);
  capacity_ = capacity;
}

void UiThread::RecordStaleUpdate(std::string_view owner) {
  std::lock_guard lock(mutex_);
  ++stale_;
  if (logger_ != nullptr) {
    logger_->Debug(kTag, "dropped UI update for {}: not in foreground", owner);
  }
}

}  // namespace mpos::runtime
