#pragma once

#include <cstdint>

namespace mpos {

// Lifecycle states. kInitialized is the pre-onCreate state of a freshly
// instantiated activity; it is never re-entered.
enum class ActivityState : uint8_t {
  kInitialized,
  kCreated,
  kStarted,
  kResumed,
  kPaused,
  kStopped,
  kDestroyed,
};

constexpr auto ActivityStateName(ActivityState state) -> const char* {
  switch (state) {
    case ActivityState::kInitialized:
      return "initialized";
    case ActivityState::kCreated:
      return "created";
    case ActivityState::kStarted:
      return "started";
    case ActivityState::kResumed:
      return "resumed";
    case ActivityState::kPaused:
      return "paused";
    case ActivityState::kStopped:
      return "stopped";
    case ActivityState::kDestroyed:
      return "destroyed";
  }
  return "initialized";
}

}  // namespace mpos
