#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "mpos/runtime/ui_thread.hpp"

namespace mpos {

// Flags an activity shares with its background work. The token outlives the
// activity, so a callback arriving after OnDestroy can still ask.
struct ActivityLiveness {
  std::atomic<bool> foreground{false};
  std::atomic<bool> destroyed{false};

  [[nodiscard]] auto IsLive() const -> bool {
    return foreground.load() && !destroyed.load();
  }
};

// Handle worker threads keep instead of a raw Activity pointer. Post()
// forwards a UI mutation to the UI thread only while the activity is in the
// foreground; the check is repeated on the UI thread right before the
// mutation runs. Stale updates are dropped, never queued for later.
class UiUpdater {
 public:
  UiUpdater() = default;
  UiUpdater(
      std::shared_ptr<ActivityLiveness> liveness,
      std::shared_ptr<runtime::UiThread> ui_thread, std::string owner);

  auto Post(std::function<void()> update) const -> bool;

  [[nodiscard]] auto IsLive() const -> bool {
    return liveness_ != nullptr && liveness_->IsLive();
  }

 private:
  std::shared_ptr<ActivityLiveness> liveness_;
  std::shared_ptr<runtime::UiThread> ui_thread_;
  std::string owner_;
};

}  // namespace mpos
