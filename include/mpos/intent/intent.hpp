#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "mpos/activity/activity_class.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/intent/bundle.hpp"

namespace mpos {

// Flag names the navigator understands. Other flags are carried untouched.
inline constexpr std::string_view kFlagClearTop = "clear_top";
inline constexpr std::string_view kFlagNoHistory = "no_history";
inline constexpr std::string_view kFlagNoAnimation = "no_animation";

// Navigation request: an explicit target class, an implicit action, or both
// (the target wins). Built progressively by the caller; the navigator copies
// it into the launched activity and never mutates the caller's instance.
class Intent {
 public:
  Intent() = default;

  static auto Explicit(ActivityClass target) -> Intent;
  static auto Implicit(std::string action) -> Intent;

  auto SetTarget(ActivityClass target) -> Intent&;
  auto SetAction(std::string action) -> Intent&;

  auto Put(std::string key, Value value) -> Intent&;
  auto Put(std::string key, const char* value) -> Intent&;
  auto AddFlag(std::string name, Value value = true) -> Intent&;

  [[nodiscard]] auto Target() const -> const std::optional<ActivityClass>& {
    return target_;
  }
  [[nodiscard]] auto Action() const -> const std::optional<std::string>& {
    return action_;
  }
  [[nodiscard]] auto Payload() const -> const Bundle& {
    return payload_;
  }
  [[nodiscard]] auto Flags() const -> const Bundle& {
    return flags_;
  }

  [[nodiscard]] auto IsExplicit() const -> bool {
    return target_.has_value();
  }

  // Present and truthy.
  [[nodiscard]] auto HasFlag(std::string_view name) const -> bool;

  // Payload lookup; nullptr when the key is absent.
  [[nodiscard]] auto Get(std::string_view key) const -> const Value*;

  // Fails with kInvalidIntent when neither target nor action is set.
  [[nodiscard]] auto Validate() const -> Result<void>;

  // Human-readable form for logs: "Intent(target=Viewer, action=VIEW, ...)"
  [[nodiscard]] auto Describe() const -> std::string;

 private:
  std::optional<ActivityClass> target_;
  std::optional<std::string> action_;
  Bundle payload_;
  Bundle flags_;
};

}  // namespace mpos
