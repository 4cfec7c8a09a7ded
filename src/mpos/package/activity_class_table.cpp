#include "mpos/package/activity_class_table.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mpos {

auto ActivityClassTable::Register(ActivityClass activity_class) -> bool {
  std::string name = activity_class.name;
  return classes_.emplace(std::move(name), std::move(activity_class)).second;
}

auto ActivityClassTable::Find(std::string_view name) const
    -> std::optional<ActivityClass> {
  if (auto it = classes_.find(name); it != classes_.end()) {
    return it->second;
  }
  if (!fallback_) {
    return std::nullopt;
  }
  return ActivityClass{
      .name = std::string(name),
      .factory = [fallback = fallback_,
                  class_name = std::string(name)]()
          -> std::unique_ptr<Activity> { return fallback(class_name); },
  };
}

auto ActivityClassTable::Names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(classes_.size());
  for (const auto& [name, activity_class] : classes_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace mpos
