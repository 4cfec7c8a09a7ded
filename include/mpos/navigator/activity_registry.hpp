#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "mpos/activity/activity_class.hpp"
#include "mpos/intent/intent.hpp"

namespace mpos {

// Maps action strings to the activity classes that handle them.
//
// Candidates keep registration order, which is also the order the chooser
// lists them in. Registering the same class (by name) twice for an action is
// a no-op. Populated during start-up, read-only afterwards; not thread-safe.
class ActivityRegistry {
 public:
  // Returns false if the class has no factory or was already registered for
  // the action.
  auto Register(const std::string& action, ActivityClass activity_class)
      -> bool;

  // Candidates for an implicit intent, in registration order. Explicit
  // intents are not resolved here and yield an empty list.
  [[nodiscard]] auto Resolve(const Intent& intent) const
      -> std::vector<ActivityClass>;

  [[nodiscard]] auto Candidates(std::string_view action) const
      -> const std::vector<ActivityClass>&;

  // Actions in first-registration order.
  [[nodiscard]] auto Actions() const -> const std::vector<std::string>& {
    return action_order_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return action_order_.size();
  }

 private:
  std::vector<std::string> action_order_;
  std::unordered_map<std::string, std::vector<ActivityClass>> candidates_;
};

}  // namespace mpos
