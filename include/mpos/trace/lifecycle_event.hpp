#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "mpos/activity/launch_id.hpp"

namespace mpos::trace {

enum class Hook : uint8_t {
  kCreate,
  kStart,
  kResume,
  kPause,
  kStop,
  kDestroy,
};

constexpr auto HookName(Hook hook) -> const char* {
  switch (hook) {
    case Hook::kCreate:
      return "onCreate";
    case Hook::kStart:
      return "onStart";
    case Hook::kResume:
      return "onResume";
    case Hook::kPause:
      return "onPause";
    case Hook::kStop:
      return "onStop";
    case Hook::kDestroy:
      return "onDestroy";
  }
  return "onCreate";
}

// Emitted right before the navigator invokes a lifecycle hook.
struct HookCalled {
  LaunchId launch;
  std::string class_name;
  Hook hook;
};

// Stack depth after a push or pop.
struct StackChanged {
  size_t depth;
};

// Emitted right before a result callback runs.
struct ResultDelivered {
  LaunchId launch;
  std::string class_name;
  std::string result_code;
};

// Candidate names, in registration order, of an implicit intent that
// resolved to more than one handler.
struct ChooserShown {
  std::vector<std::string> candidates;
};

using LifecycleEvent =
    std::variant<HookCalled, StackChanged, ResultDelivered, ChooserShown>;

}  // namespace mpos::trace
