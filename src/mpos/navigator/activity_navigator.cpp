#include "mpos/navigator/activity_navigator.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mpos/common/internal_error.hpp"
#include "mpos/navigator/chooser_activity.hpp"

namespace mpos {

namespace {

constexpr std::string_view kTag = "navigator";

// Marks the navigator as mid-transition for the lifetime of the guard.
class TransitionGuard {
 public:
  explicit TransitionGuard(uint32_t& depth) : depth_(depth) {
    ++depth_;
  }
  ~TransitionGuard() {
    --depth_;
  }

  TransitionGuard(const TransitionGuard&) = delete;
  TransitionGuard& operator=(const TransitionGuard&) = delete;
  TransitionGuard(TransitionGuard&&) = delete;
  TransitionGuard& operator=(TransitionGuard&&) = delete;

 private:
  uint32_t& depth_;
};

auto Label(const Activity& activity) -> std::string {
  return fmt::format(
      "{}#{}", activity.ClassName(), activity.GetLaunchId().value);
}

}  // namespace

ActivityNavigator::ActivityNavigator(
    ActivityRegistry& registry, Logger& logger, size_t ui_queue_capacity)
    : registry_(registry),
      logger_(logger),
      ui_thread_(
          std::make_shared<runtime::UiThread>(logger, ui_queue_capacity)) {
}

ActivityNavigator::~ActivityNavigator() {
  // No hooks run here; background work still holding liveness tokens must
  // see the activities as gone.
  for (auto& entry : stack_) {
    entry.activity->liveness_->foreground.store(false);
    entry.activity->liveness_->destroyed.store(true);
  }
  // Updaters may keep the queue alive past logger_.
  ui_thread_->Close();
}

auto ActivityNavigator::StartActivity(const Intent& intent)
    -> Result<LaunchOutcome> {
  return StartFrom(LaunchId::Invalid(), intent, nullptr);
}

auto ActivityNavigator::StartActivityForResult(
    const Intent& intent, ResultCallback callback) -> Result<LaunchOutcome> {
  return StartFrom(LaunchId::Invalid(), intent, std::move(callback));
}

void ActivityNavigator::FinishTop() {
  RunOrDefer([this]() { DoFinishTop(std::nullopt, {}); });
}

void ActivityNavigator::FinishTop(std::string result_code, Bundle result_data) {
  RunOrDefer(
      [this, code = std::move(result_code),
       data = std::move(result_data)]() mutable {
        DoFinishTop(std::move(code), std::move(data));
      });
}

auto ActivityNavigator::Back() -> bool {
  if (stack_.size() <= 1) {
    logger_.Debug(kTag, "back ignored: already at the root activity");
    return false;
  }
  RunOrDefer([this]() {
    if (stack_.size() > 1) {
      DoFinishTop(std::nullopt, {});
    }
  });
  return true;
}

auto ActivityNavigator::Choose(LaunchId chooser, size_t index) -> bool {
  if (!IsTop(chooser)) {
    logger_.Debug(kTag, "choice ignored: chooser is not on top");
    return false;
  }
  auto* activity = dynamic_cast<ChooserActivity*>(stack_.back().activity.get());
  if (activity == nullptr) {
    logger_.Debug(kTag, "choice ignored: top activity is not a chooser");
    return false;
  }
  if (index >= activity->Candidates().size()) {
    std::string message = fmt::format(
        "choice {} out of range: the chooser offers {} candidates", index,
        activity->Candidates().size());
    logger_.Warn(kTag, "{}", message);
    diagnostics_.Warning(DiagCode::kInvalidChoice, std::move(message));
    return false;
  }
  RunOrDefer([this, chooser, index]() { DoChoose(chooser, index); });
  return true;
}

void ActivityNavigator::OnAppBackground() {
  RunOrDefer([this]() {
    if (!app_foreground_) return;
    app_foreground_ = false;
    logger_.Info(kTag, "app moved to background");
    if (stack_.empty()) return;

    Activity& top = *stack_.back().activity;
    if (top.State() == ActivityState::kResumed) {
      Drive(top, trace::Hook::kPause);
    }
    if (top.State() == ActivityState::kPaused ||
        top.State() == ActivityState::kStarted) {
      Drive(top, trace::Hook::kStop);
    }
  });
}

void ActivityNavigator::OnAppForeground() {
  RunOrDefer([this]() {
    if (app_foreground_) return;
    app_foreground_ = true;
    logger_.Info(kTag, "app moved to foreground");
    if (stack_.empty()) return;

    StackEntry& top = stack_.back();
    if (top.activity->State() == ActivityState::kStopped) {
      Drive(*top.activity, trace::Hook::kStart);
    }
    ResumeTop();
  });
}

void ActivityNavigator::Shutdown() {
  RunOrDefer([this]() {
    logger_.Info(kTag, "shutting down {} activities", stack_.size());
    while (!stack_.empty()) {
      StackEntry entry = std::move(stack_.back());
      stack_.pop_back();
      trace_.EmitStackChanged(stack_.size());
      Teardown(entry);
    }
    // Navigation requested by the destroy hooks has nowhere to go.
    deferred_.clear();
  });
}

auto ActivityNavigator::Top() const -> Activity* {
  if (stack_.empty()) {
    return nullptr;
  }
  return stack_.back().activity.get();
}

auto ActivityNavigator::ActivityAt(size_t index) const -> Activity* {
  if (index >= stack_.size()) {
    return nullptr;
  }
  return stack_[index].activity.get();
}

auto ActivityNavigator::StackClassNames() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(stack_.size());
  for (const auto& entry : stack_) {
    names.push_back(entry.activity->ClassName());
  }
  return names;
}

auto ActivityNavigator::StartFrom(
    LaunchId caller, const Intent& intent, ResultCallback callback)
    -> Result<LaunchOutcome> {
  if (!ui_thread_->IsUiThread()) {
    common::ThrowInternalError(
        "ActivityNavigator::StartFrom", "navigation off the UI thread");
  }

  if (auto valid = intent.Validate(); !valid) {
    logger_.Error(kTag, "{}", valid.error().primary.message);
    return std::unexpected(valid.error());
  }
  if (intent.Target() && !intent.Target()->factory) {
    std::string message = fmt::format(
        "target class '{}' has no factory", intent.Target()->name);
    logger_.Error(kTag, "{}", message);
    return std::unexpected(
        Diagnostic::Error(DiagCode::kInvalidIntent, std::move(message)));
  }

  if (caller.IsValid() && !IsTop(caller)) {
    logger_.Debug(
        kTag, "launch of {} ignored: caller #{} is not on top",
        intent.Describe(), caller.value);
    return LaunchOutcome::kIgnored;
  }

  if (transition_depth_ > 0) {
    logger_.Debug(kTag, "deferring {} until the current transition ends",
                  intent.Describe());
    deferred_.push_back(
        [this, caller, intent, callback = std::move(callback)]() mutable {
          if (caller.IsValid() && !IsTop(caller)) {
            logger_.Debug(
                kTag, "deferred launch from #{} ignored: caller left the top",
                caller.value);
            return;
          }
          Dispatch(caller, intent, std::move(callback));
        });
    return LaunchOutcome::kDeferred;
  }

  LaunchOutcome outcome = LaunchOutcome::kIgnored;
  RunTransition(
      [&]() { outcome = Dispatch(caller, intent, std::move(callback)); });
  return outcome;
}

void ActivityNavigator::FinishActivity(
    LaunchId launch, std::optional<std::string> result_code,
    Bundle result_data) {
  if (!IsTop(launch)) {
    std::string message = fmt::format(
        "finish of #{} ignored: it is not on top of the stack", launch.value);
    logger_.Debug(kTag, "{}", message);
    diagnostics_.Note(DiagCode::kDoubleFinishIgnored, std::move(message));
    return;
  }
  RunOrDefer(
      [this, launch, code = std::move(result_code),
       data = std::move(result_data)]() mutable {
        // Re-checked: a deferred finish may find something else on top.
        if (!IsTop(launch)) {
          logger_.Debug(
              kTag, "deferred finish of #{} ignored: no longer on top",
              launch.value);
          return;
        }
        DoFinishTop(std::move(code), std::move(data));
      });
}

auto ActivityNavigator::RunOrDefer(std::function<void()> op) -> bool {
  if (!ui_thread_->IsUiThread()) {
    common::ThrowInternalError(
        "ActivityNavigator::RunOrDefer", "navigation off the UI thread");
  }
  if (transition_depth_ > 0) {
    deferred_.push_back(std::move(op));
    return false;
  }
  RunTransition(op);
  return true;
}

void ActivityNavigator::RunTransition(const std::function<void()>& op) {
  try {
    {
      TransitionGuard guard(transition_depth_);
      op();
    }
    DrainDeferred();
  } catch (...) {
    // Requests queued behind a failed transition were made against a stack
    // that no longer exists.
    if (!deferred_.empty()) {
      logger_.Warn(
          kTag, "transition threw; dropping {} queued navigation requests",
          deferred_.size());
      deferred_.clear();
    }
    throw;
  }
}

void ActivityNavigator::DrainDeferred() {
  while (!deferred_.empty() && transition_depth_ == 0) {
    std::function<void()> op = std::move(deferred_.front());
    deferred_.pop_front();
    TransitionGuard guard(transition_depth_);
    op();
  }
}

auto ActivityNavigator::Dispatch(
    LaunchId caller, const Intent& intent, ResultCallback callback)
    -> LaunchOutcome {
  if (intent.Target()) {
    Launch(caller, *intent.Target(), intent, std::move(callback));
    return LaunchOutcome::kLaunched;
  }

  const std::string& action = *intent.Action();
  std::vector<ActivityClass> candidates = registry_.Resolve(intent);
  if (candidates.empty()) {
    std::string message =
        fmt::format("no activity handles action '{}'", action);
    logger_.Warn(kTag, "{}", message);
    diagnostics_.Warning(DiagCode::kNoHandler, std::move(message));
    return LaunchOutcome::kNoHandler;
  }

  if (candidates.size() == 1) {
    logger_.Debug(
        kTag, "action '{}' resolved to {}", action, candidates.front().name);
    Launch(caller, candidates.front(), intent, std::move(callback));
    return LaunchOutcome::kLaunched;
  }

  ShowChooser(caller, std::move(candidates), intent, std::move(callback));
  return LaunchOutcome::kChooserShown;
}

void ActivityNavigator::ShowChooser(
    LaunchId caller, std::vector<ActivityClass> candidates,
    const Intent& intent, ResultCallback callback) {
  std::vector<std::string> names;
  names.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    names.push_back(candidate.name);
  }
  logger_.Info(
      kTag, "{} handlers for action '{}', showing chooser", names.size(),
      *intent.Action());
  trace_.EmitChooserShown(names);

  ActivityClass chooser_class{
      .name = std::string(kChooserClassName),
      .factory = [candidates = std::move(candidates),
                  original = intent]() -> std::unique_ptr<Activity> {
        return std::make_unique<ChooserActivity>(candidates, original);
      },
  };

  Intent chooser_intent = Intent::Explicit(chooser_class);
  chooser_intent.Put(std::string(kChooserCandidatesKey), std::move(names));
  chooser_intent.Put(std::string(kChooserActionKey), *intent.Action());

  Launch(caller, chooser_class, std::move(chooser_intent), std::move(callback));
}

void ActivityNavigator::Launch(
    LaunchId caller, const ActivityClass& activity_class, Intent intent,
    ResultCallback callback) {
  std::unique_ptr<Activity> activity = activity_class.factory();
  if (activity == nullptr) {
    common::ThrowInternalError(
        "ActivityNavigator::Launch",
        fmt::format("factory for '{}' returned null", activity_class.name));
  }

  if (intent.HasFlag(kFlagClearTop)) {
    ClearTop(activity_class.name);
  }
  HideTop();

  LaunchId launch = NextLaunchId();
  bool no_history = intent.HasFlag(kFlagNoHistory);
  bool animate = !intent.HasFlag(kFlagNoAnimation);
  logger_.Info(
      kTag, "launch {}#{} from {}", activity_class.name, launch.value,
      intent.Describe());

  activity->Attach(*this, launch, activity_class.name, std::move(intent));
  Activity& launched = *activity;
  stack_.push_back(
      StackEntry{
          .activity = std::move(activity),
          .no_history = no_history,
          .animate = animate});
  trace_.EmitStackChanged(stack_.size());

  if (callback) {
    results_.Bind(launch, caller, std::move(callback));
  }

  try {
    Drive(launched, trace::Hook::kCreate);
  } catch (...) {
    // Never created, so no further hooks run for it.
    logger_.Error(
        kTag, "{} threw from onCreate; removing it", Label(launched));
    launched.liveness_->destroyed.store(true);
    results_.Discard(launch);
    stack_.pop_back();
    trace_.EmitStackChanged(stack_.size());
    ResumeTop();
    throw;
  }
  Drive(launched, trace::Hook::kStart);
  ResumeTop();
}

void ActivityNavigator::DoFinishTop(
    std::optional<std::string> result_code, Bundle result_data) {
  if (stack_.empty()) {
    logger_.Debug(kTag, "finish ignored: the stack is empty");
    return;
  }

  StackEntry entry = std::move(stack_.back());
  stack_.pop_back();
  trace_.EmitStackChanged(stack_.size());

  LaunchId launch = entry.activity->GetLaunchId();
  std::string class_name = entry.activity->ClassName();
  logger_.Info(
      kTag, "finish {}{}", Label(*entry.activity),
      result_code ? fmt::format(" with result '{}'", *result_code) : "");

  std::optional<ResultChannel::Entry> pending = results_.Take(launch);
  Teardown(entry);
  entry.activity.reset();

  if (pending) {
    if (!result_code) {
      logger_.Debug(
          kTag, "{}#{} finished without a result code; nothing delivered",
          class_name, launch.value);
    } else if (pending->caller.IsValid() && !IsAlive(pending->caller)) {
      logger_.Debug(
          kTag, "result of {}#{} dropped: caller #{} is gone", class_name,
          launch.value, pending->caller.value);
    } else {
      trace_.EmitResultDelivered(launch, class_name, *result_code);
      try {
        pending->callback(
            ActivityResult{
                .result_code = std::move(result_code),
                .data = std::move(result_data)});
      } catch (...) {
        ResumeTop();
        throw;
      }
    }
  }

  ResumeTop();
}

void ActivityNavigator::DoChoose(LaunchId chooser, size_t index) {
  if (!IsTop(chooser)) return;
  auto* activity = dynamic_cast<ChooserActivity*>(stack_.back().activity.get());
  if (activity == nullptr || index >= activity->Candidates().size()) return;

  ActivityClass chosen = activity->Candidates()[index];
  Intent intent = activity->Original();
  intent.SetTarget(chosen);
  logger_.Info(kTag, "chooser picked {}", chosen.name);

  StackEntry entry = std::move(stack_.back());
  stack_.pop_back();
  trace_.EmitStackChanged(stack_.size());

  // The launcher's callback follows the choice to the chosen activity.
  std::optional<ResultChannel::Entry> pending = results_.Take(chooser);
  Teardown(entry);
  entry.activity.reset();

  LaunchId caller = LaunchId::Invalid();
  ResultCallback callback;
  if (pending && (!pending->caller.IsValid() || IsAlive(pending->caller))) {
    caller = pending->caller;
    callback = std::move(pending->callback);
  }
  Launch(caller, chosen, std::move(intent), std::move(callback));
}

void ActivityNavigator::HideTop() {
  if (stack_.empty()) return;

  if (stack_.back().no_history) {
    StackEntry entry = std::move(stack_.back());
    stack_.pop_back();
    trace_.EmitStackChanged(stack_.size());
    logger_.Debug(
        kTag, "{} has no_history; destroying it", Label(*entry.activity));
    Teardown(entry);
    return;
  }

  Activity& top = *stack_.back().activity;
  if (top.State() == ActivityState::kResumed) {
    Drive(top, trace::Hook::kPause);
  }
  if (top.State() == ActivityState::kPaused ||
      top.State() == ActivityState::kStarted) {
    Drive(top, trace::Hook::kStop);
  }
}

void ActivityNavigator::ClearTop(const std::string& class_name) {
  size_t found = stack_.size();
  for (size_t i = stack_.size(); i > 0; --i) {
    if (stack_[i - 1].activity->ClassName() == class_name) {
      found = i - 1;
      break;
    }
  }
  if (found == stack_.size()) return;

  logger_.Info(
      kTag, "clear_top: removing {} activities down to {}",
      stack_.size() - found, class_name);
  while (stack_.size() > found) {
    StackEntry entry = std::move(stack_.back());
    stack_.pop_back();
    trace_.EmitStackChanged(stack_.size());
    Teardown(entry);
  }
}

void ActivityNavigator::ResumeTop() {
  if (stack_.empty() || !app_foreground_) return;

  StackEntry& top = stack_.back();
  if (top.activity->State() == ActivityState::kResumed) return;

  Drive(*top.activity, trace::Hook::kResume);
  if (surface_host_ != nullptr) {
    surface_host_->Present(*top.activity->ContentView(), top.animate);
  }
}

void ActivityNavigator::Teardown(StackEntry& entry) {
  Activity& activity = *entry.activity;
  if (activity.State() == ActivityState::kResumed) {
    Drive(activity, trace::Hook::kPause);
  }
  if (activity.State() == ActivityState::kPaused ||
      activity.State() == ActivityState::kStarted) {
    Drive(activity, trace::Hook::kStop);
  }
  Drive(activity, trace::Hook::kDestroy);

  std::unique_ptr<Surface> surface = activity.ReleaseContentView();
  if (surface_host_ != nullptr && surface != nullptr) {
    surface_host_->Release(*surface);
  }

  if (results_.Discard(activity.GetLaunchId())) {
    logger_.Debug(
        kTag, "{} destroyed without finishing; pending result discarded",
        Label(activity));
  }
}

void ActivityNavigator::Drive(Activity& activity, trace::Hook hook) {
  trace_.EmitHook(activity.GetLaunchId(), activity.ClassName(), hook);
  logger_.Debug(kTag, "{} {}", Label(activity), trace::HookName(hook));

  switch (hook) {
    case trace::Hook::kCreate:
      if (!activity.PerformCreate()) {
        logger_.Debug(
            kTag, "{} set no content view; using a blank surface",
            Label(activity));
      }
      break;
    case trace::Hook::kStart:
      activity.PerformStart();
      break;
    case trace::Hook::kResume:
      activity.PerformResume();
      break;
    case trace::Hook::kPause:
      activity.PerformPause();
      break;
    case trace::Hook::kStop:
      activity.PerformStop();
      break;
    case trace::Hook::kDestroy:
      activity.PerformDestroy();
      break;
  }
}

auto ActivityNavigator::IsTop(LaunchId launch) const -> bool {
  return !stack_.empty() && stack_.back().activity->GetLaunchId() == launch;
}

auto ActivityNavigator::IsAlive(LaunchId launch) const -> bool {
  for (const auto& entry : stack_) {
    if (entry.activity->GetLaunchId() == launch) {
      return true;
    }
  }
  return false;
}

auto ActivityNavigator::NextLaunchId() -> LaunchId {
  if (next_launch_ == UINT32_MAX) {
    common::ThrowInternalError(
        "ActivityNavigator::NextLaunchId", "launch ids exhausted");
  }
  return LaunchId{next_launch_++};
}

}  // namespace mpos
