#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mpos/activity/activity_result.hpp"
#include "mpos/activity/activity_state.hpp"
#include "mpos/activity/launch_id.hpp"
#include "mpos/activity/surface.hpp"
#include "mpos/activity/ui_updater.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/intent/intent.hpp"

namespace mpos {

class ActivityNavigator;

// A single screen with a managed lifecycle.
//
// Subclasses override the On* hooks they care about; every hook defaults to
// a no-op. Hooks are driven only by the ActivityNavigator through the
// Perform* wrappers, which also keep State() and HasForeground() in sync, so
// an override never has to call the base implementation.
//
// Typical subclass:
//   class ShareActivity : public Activity {
//    protected:
//     void OnCreate() override {
//       SetContentView(std::make_unique<Surface>("share"));
//     }
//     void OnResume(Surface& surface) override { ... }
//   };
class Activity {
 public:
  Activity();
  virtual ~Activity() = default;

  Activity(const Activity&) = delete;
  Activity& operator=(const Activity&) = delete;
  Activity(Activity&&) = delete;
  Activity& operator=(Activity&&) = delete;

  // Navigation convenience surface. Delegates to the navigator this activity
  // is attached to, naming this activity as the caller. A call made while
  // this activity is not on top of the stack is ignored.
  auto StartActivity(const Intent& intent) -> Result<LaunchOutcome>;
  auto StartActivityForResult(const Intent& intent, ResultCallback callback)
      -> Result<LaunchOutcome>;

  // Asks the navigator to remove this activity from the top of the stack.
  // With a result code, the launcher's callback (if any) receives
  // {result_code, result_data}. No-op unless this activity is on top.
  void Finish();
  void Finish(std::string result_code, Bundle result_data = {});

  // Runs `update` on the UI thread if this activity is still in the
  // foreground by then. Callable from any thread; returns false when the
  // update was dropped up front.
  auto UpdateUiThreadsafe(std::function<void()> update) -> bool;

  // Handle for worker threads that may outlive this object.
  [[nodiscard]] auto MakeUiUpdater() const -> UiUpdater;

  [[nodiscard]] auto HasForeground() const -> bool {
    return liveness_->foreground.load();
  }
  [[nodiscard]] auto IsDestroyed() const -> bool {
    return liveness_->destroyed.load();
  }
  [[nodiscard]] auto State() const -> ActivityState {
    return state_;
  }
  [[nodiscard]] auto GetIntent() const -> const Intent& {
    return intent_;
  }
  [[nodiscard]] auto ClassName() const -> const std::string& {
    return class_name_;
  }
  [[nodiscard]] auto GetLaunchId() const -> LaunchId {
    return launch_id_;
  }
  [[nodiscard]] auto ContentView() const -> Surface* {
    return content_.get();
  }
  [[nodiscard]] auto IsAttached() const -> bool {
    return navigator_ != nullptr;
  }

 protected:
  // Called once, before any other hook. Build the surface and hand it to
  // SetContentView.
  virtual void OnCreate() {
  }
  virtual void OnStart(Surface& /*surface*/) {
  }
  virtual void OnResume(Surface& /*surface*/) {
  }
  virtual void OnPause(Surface& /*surface*/) {
  }
  virtual void OnStop(Surface& /*surface*/) {
  }
  // Called once; no hook fires afterwards.
  virtual void OnDestroy(Surface& /*surface*/) {
  }

  void SetContentView(std::unique_ptr<Surface> surface);

  [[nodiscard]] auto Navigator() const -> ActivityNavigator* {
    return navigator_;
  }

 private:
  friend class ActivityNavigator;

  void Attach(
      ActivityNavigator& navigator, LaunchId launch_id, std::string class_name,
      Intent intent);

  // Returns false when OnCreate did not set a content view; a blank surface
  // named after the class is installed in that case.
  auto PerformCreate() -> bool;
  void PerformStart();
  void PerformResume();
  void PerformPause();
  void PerformStop();
  void PerformDestroy();

  auto ReleaseContentView() -> std::unique_ptr<Surface>;

  ActivityNavigator* navigator_ = nullptr;
  LaunchId launch_id_ = LaunchId::Invalid();
  std::string class_name_;
  Intent intent_;
  ActivityState state_ = ActivityState::kInitialized;
  std::unique_ptr<Surface> content_;
  std::shared_ptr<ActivityLiveness> liveness_;
};

}  // namespace mpos
