#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "mpos/intent/bundle.hpp"

namespace mpos {

// Payload handed to a result callback when a launched activity finishes
// with a result code.
struct ActivityResult {
  std::optional<std::string> result_code;
  Bundle data;

  auto operator==(const ActivityResult&) const -> bool = default;
};

using ResultCallback = std::function<void(const ActivityResult&)>;

// What a navigation call did. Errors (bad intents) travel separately as a
// Diagnostic in Result<LaunchOutcome>.
enum class LaunchOutcome : uint8_t {
  kLaunched,      // A new activity is on top of the stack
  kChooserShown,  // Several handlers; the chooser is on top
  kNoHandler,     // Implicit intent with no handler; nothing happened
  kDeferred,      // Issued during a transition; runs when it completes
  kIgnored,       // Issued by an activity that is not on top
};

constexpr auto LaunchOutcomeName(LaunchOutcome outcome) -> const char* {
  switch (outcome) {
    case LaunchOutcome::kLaunched:
      return "launched";
    case LaunchOutcome::kChooserShown:
      return "chooser";
    case LaunchOutcome::kNoHandler:
      return "no-handler";
    case LaunchOutcome::kDeferred:
      return "deferred";
    case LaunchOutcome::kIgnored:
      return "ignored";
  }
  return "ignored";
}

}  // namespace mpos
