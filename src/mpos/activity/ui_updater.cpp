#include "mpos/activity/ui_updater.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace mpos {

UiUpdater::UiUpdater(
    std::shared_ptr<ActivityLiveness> liveness,
    std::shared_ptr<runtime::UiThread> ui_thread, std::string owner)
    : liveness_(std::move(liveness)),
      ui_thread_(std::move(ui_thread)),
      owner_(std::move(owner)) {
}

auto UiUpdater::Post(std::function<void()> update) const -> bool {
  if (ui_thread_ == nullptr || liveness_ == nullptr) {
    return false;
  }
  if (!liveness_->IsLive()) {
    ui_thread_->RecordStaleUpdate(owner_);
    return false;
  }

  return ui_thread_->Post(
      [liveness = liveness_, ui_thread = ui_thread_.get(), owner = owner_,
       update = std::move(update)]() {
        // The activity may have been paused or destroyed between Post and
        // this drain. The raw queue pointer is safe: only that queue runs
        // this task.
        if (!liveness->IsLive()) {
          ui_thread->RecordStaleUpdate(owner);
          return;
        }
        update();
      });
}

}  // namespace mpos
