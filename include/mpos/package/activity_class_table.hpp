#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mpos/activity/activity.hpp"
#include "mpos/activity/activity_class.hpp"

namespace mpos {

// Produces an instance for a class name that was never registered.
using FallbackFactory =
    std::function<std::unique_ptr<Activity>(const std::string& class_name)>;

// The activity classes compiled into the process, by name. Manifests refer
// to classes by name; the app manager resolves them here.
class ActivityClassTable {
 public:
  // Returns false if a class with this name already exists.
  auto Register(ActivityClass activity_class) -> bool;

  template <typename T>
  auto Register(std::string name) -> bool {
    return Register(MakeActivityClass<T>(std::move(name)));
  }

  // Unknown names resolve through the fallback when one is set.
  void SetFallback(FallbackFactory fallback) {
    fallback_ = std::move(fallback);
  }

  [[nodiscard]] auto Find(std::string_view name) const
      -> std::optional<ActivityClass>;

  [[nodiscard]] auto Contains(std::string_view name) const -> bool {
    return classes_.contains(name);
  }

  [[nodiscard]] auto Names() const -> std::vector<std::string>;

  [[nodiscard]] auto Size() const -> size_t {
    return classes_.size();
  }

 private:
  std::map<std::string, ActivityClass, std::less<>> classes_;
  FallbackFactory fallback_;
};

}  // namespace mpos
