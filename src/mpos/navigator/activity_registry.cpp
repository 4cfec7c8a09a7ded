#include "mpos/navigator/activity_registry.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mpos {

auto ActivityRegistry::Register(
    const std::string& action, ActivityClass activity_class) -> bool {
  if (!activity_class.factory) {
    return false;
  }
  auto [it, inserted] = candidates_.try_emplace(action);
  if (inserted) {
    action_order_.push_back(action);
  }

  auto& list = it->second;
  if (std::ranges::find(list, activity_class) != list.end()) {
    return false;
  }
  list.push_back(std::move(activity_class));
  return true;
}

auto ActivityRegistry::Resolve(const Intent& intent) const
    -> std::vector<ActivityClass> {
  if (intent.IsExplicit() || !intent.Action()) {
    return {};
  }
  return Candidates(*intent.Action());
}

auto ActivityRegistry::Candidates(std::string_view action) const
    -> const std::vector<ActivityClass>& {
  static const std::vector<ActivityClass> kEmpty;
  auto it = candidates_.find(std::string(action));
  if (it == candidates_.end()) {
    return kEmpty;
  }
  return it->second;
}

}  // namespace mpos
