#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mpos/activity/activity.hpp"
#include "mpos/activity/activity_class.hpp"
#include "mpos/activity/activity_result.hpp"
#include "mpos/activity/launch_id.hpp"
#include "mpos/activity/surface.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/diagnostic/diagnostic_sink.hpp"
#include "mpos/common/logger.hpp"
#include "mpos/intent/intent.hpp"
#include "mpos/navigator/activity_registry.hpp"
#include "mpos/navigator/result_channel.hpp"
#include "mpos/runtime/ui_thread.hpp"
#include "mpos/trace/lifecycle_event.hpp"
#include "mpos/trace/trace_manager.hpp"

namespace mpos {

// Routing engine and owner of the activity stack.
//
// All operations run on the UI thread and are synchronous: when a call
// returns, every lifecycle hook it caused has run. The navigator is not
// reentrant; a navigation call made from inside a hook or a result callback
// is validated immediately and then queued, and the queue drains in order
// once the outer operation completes.
//
// Launch:  top.onPause, top.onStop, new.onCreate, new.onStart, new.onResume
// Finish:  top.onPause, top.onStop, top.onDestroy, <result>, below.onResume
class ActivityNavigator {
 public:
  ActivityNavigator(
      ActivityRegistry& registry, Logger& logger,
      size_t ui_queue_capacity = runtime::UiThread::kDefaultCapacity);
  ~ActivityNavigator();

  ActivityNavigator(const ActivityNavigator&) = delete;
  ActivityNavigator& operator=(const ActivityNavigator&) = delete;
  ActivityNavigator(ActivityNavigator&&) = delete;
  ActivityNavigator& operator=(ActivityNavigator&&) = delete;

  // Launch from outside any activity (shell, tests). Fails only with
  // kInvalidIntent. An exception from an activity hook propagates; an
  // activity whose onCreate threw is removed from the stack first.
  auto StartActivity(const Intent& intent) -> Result<LaunchOutcome>;
  auto StartActivityForResult(const Intent& intent, ResultCallback callback)
      -> Result<LaunchOutcome>;

  // Finish whatever is on top.
  void FinishTop();
  void FinishTop(std::string result_code, Bundle result_data = {});

  // Back key: finishes the top without a result unless it is the root
  // activity. Returns false when nothing was (or will be) finished.
  auto Back() -> bool;

  // Picks a candidate on the chooser identified by `chooser`. Returns false
  // if that chooser is not on top or the index is out of range.
  auto Choose(LaunchId chooser, size_t index) -> bool;

  // App-level focus. Backgrounding pauses and stops the top activity;
  // foregrounding starts and resumes it again.
  void OnAppBackground();
  void OnAppForeground();
  [[nodiscard]] auto IsAppForeground() const -> bool {
    return app_foreground_;
  }

  // Destroys every activity, top first, without delivering results.
  void Shutdown();

  [[nodiscard]] auto Top() const -> Activity*;
  [[nodiscard]] auto StackDepth() const -> size_t {
    return stack_.size();
  }
  [[nodiscard]] auto ActivityAt(size_t index) const -> Activity*;
  [[nodiscard]] auto StackClassNames() const -> std::vector<std::string>;

  [[nodiscard]] auto Registry() const -> const ActivityRegistry& {
    return registry_;
  }
  [[nodiscard]] auto Results() const -> const ResultChannel& {
    return results_;
  }
  [[nodiscard]] auto Diagnostics() const -> const DiagnosticSink& {
    return diagnostics_;
  }
  [[nodiscard]] auto Trace() -> trace::TraceManager& {
    return trace_;
  }
  [[nodiscard]] auto GetUiThread() const -> runtime::UiThread& {
    return *ui_thread_;
  }
  [[nodiscard]] auto SharedUiThread() const
      -> std::shared_ptr<runtime::UiThread> {
    return ui_thread_;
  }

  void SetSurfaceHost(SurfaceHost* host) {
    surface_host_ = host;
  }

 private:
  friend class Activity;

  struct StackEntry {
    std::unique_ptr<Activity> activity;
    bool no_history = false;
    bool animate = true;
  };

  // Entry points used by Activity's convenience surface.
  auto StartFrom(LaunchId caller, const Intent& intent, ResultCallback callback)
      -> Result<LaunchOutcome>;
  void FinishActivity(
      LaunchId launch, std::optional<std::string> result_code,
      Bundle result_data);

  // Runs `op` now, or queues it if a transition is in progress. Returns true
  // when it ran immediately.
  auto RunOrDefer(std::function<void()> op) -> bool;
  // Runs `op` as the outermost transition, then drains deferred requests.
  // If anything throws, the depth is restored, the remaining deferred
  // requests are dropped and the exception propagates.
  void RunTransition(const std::function<void()>& op);
  void DrainDeferred();

  auto Dispatch(LaunchId caller, const Intent& intent, ResultCallback callback)
      -> LaunchOutcome;
  void ShowChooser(
      LaunchId caller, std::vector<ActivityClass> candidates,
      const Intent& intent, ResultCallback callback);
  void Launch(
      LaunchId caller, const ActivityClass& activity_class, Intent intent,
      ResultCallback callback);
  void DoFinishTop(std::optional<std::string> result_code, Bundle result_data);
  void DoChoose(LaunchId chooser, size_t index);

  // Moves the current top out of the foreground ahead of a launch: pause and
  // stop, or a full teardown for a no_history entry.
  void HideTop();
  void ClearTop(const std::string& class_name);
  void ResumeTop();

  // Pause/stop as needed, destroy, release the surface and drop any pending
  // result for the entry. The entry must already be off the stack.
  void Teardown(StackEntry& entry);

  void Drive(Activity& activity, trace::Hook hook);

  [[nodiscard]] auto IsTop(LaunchId launch) const -> bool;
  [[nodiscard]] auto IsAlive(LaunchId launch) const -> bool;
  auto NextLaunchId() -> LaunchId;

  ActivityRegistry& registry_;
  Logger& logger_;
  std::shared_ptr<runtime::UiThread> ui_thread_;
  DiagnosticSink diagnostics_;
  trace::TraceManager trace_;
  ResultChannel results_;
  SurfaceHost* surface_host_ = nullptr;

  std::vector<StackEntry> stack_;
  uint32_t next_launch_ = 0;
  uint32_t transition_depth_ = 0;
  std::deque<std::function<void()>> deferred_;
  bool app_foreground_ = true;
};

}  // namespace mpos
