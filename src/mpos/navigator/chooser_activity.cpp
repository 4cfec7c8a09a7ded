#include "mpos/navigator/chooser_activity.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mpos/navigator/activity_navigator.hpp"

namespace mpos {

ChooserActivity::ChooserActivity(
    std::vector<ActivityClass> candidates, Intent original)
    : candidates_(std::move(candidates)), original_(std::move(original)) {
}

void ChooserActivity::OnCreate() {
  SetContentView(std::make_unique<Surface>(std::string(kChooserClassName)));
}

auto ChooserActivity::Choose(size_t index) -> bool {
  ActivityNavigator* navigator = Navigator();
  if (navigator == nullptr) {
    return false;
  }
  return navigator->Choose(GetLaunchId(), index);
}

}  // namespace mpos
