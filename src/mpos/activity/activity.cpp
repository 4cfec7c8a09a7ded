#include "mpos/activity/activity.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "mpos/navigator/activity_navigator.hpp"

namespace mpos {

namespace {

auto NotAttached() -> Diagnostic {
  return Diagnostic::Error(
      DiagCode::kNotAttached, "activity is not attached to a navigator");
}

}  // namespace

Activity::Activity() : liveness_(std::make_shared<ActivityLiveness>()) {
}

auto Activity::StartActivity(const Intent& intent) -> Result<LaunchOutcome> {
  if (navigator_ == nullptr) {
    return std::unexpected(NotAttached());
  }
  return navigator_->StartFrom(launch_id_, intent, nullptr);
}

auto Activity::StartActivityForResult(
    const Intent& intent, ResultCallback callback) -> Result<LaunchOutcome> {
  if (navigator_ == nullptr) {
    return std::unexpected(NotAttached());
  }
  return navigator_->StartFrom(launch_id_, intent, std::move(callback));
}

void Activity::Finish() {
  if (navigator_ == nullptr) return;
  navigator_->FinishActivity(launch_id_, std::nullopt, {});
}

void Activity::Finish(std::string result_code, Bundle result_data) {
  if (navigator_ == nullptr) return;
  navigator_->FinishActivity(
      launch_id_, std::move(result_code), std::move(result_data));
}

auto Activity::UpdateUiThreadsafe(std::function<void()> update) -> bool {
  return MakeUiUpdater().Post(std::move(update));
}

auto Activity::MakeUiUpdater() const -> UiUpdater {
  std::shared_ptr<runtime::UiThread> ui_thread;
  if (navigator_ != nullptr) {
    ui_thread = navigator_->SharedUiThread();
  }
  return UiUpdater(liveness_, std::move(ui_thread), class_name_);
}

void Activity::SetContentView(std::unique_ptr<Surface> surface) {
  if (surface == nullptr) return;
  content_ = std::move(surface);
}

void Activity::Attach(
    ActivityNavigator& navigator, LaunchId launch_id, std::string class_name,
    Intent intent) {
  navigator_ = &navigator;
  launch_id_ = launch_id;
  class_name_ = std::move(class_name);
  intent_ = std::move(intent);
}

auto Activity::PerformCreate() -> bool {
  state_ = ActivityState::kCreated;
  OnCreate();
  if (content_ == nullptr) {
    content_ = std::make_unique<Surface>(class_name_);
    return false;
  }
  return true;
}

void Activity::PerformStart() {
  state_ = ActivityState::kStarted;
  OnStart(*content_);
}

void Activity::PerformResume() {
  state_ = ActivityState::kResumed;
  liveness_->foreground.store(true);
  OnResume(*content_);
}

void Activity::PerformPause() {
  liveness_->foreground.store(false);
  state_ = ActivityState::kPaused;
  OnPause(*content_);
}

void Activity::PerformStop() {
  state_ = ActivityState::kStopped;
  OnStop(*content_);
}

void Activity::PerformDestroy() {
  liveness_->foreground.store(false);
  liveness_->destroyed.store(true);
  state_ = ActivityState::kDestroyed;
  OnDestroy(*content_);
}

auto Activity::ReleaseContentView() -> std::unique_ptr<Surface> {
  return std::move(content_);
}

}  // namespace mpos
