#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "mpos/activity/activity.hpp"
#include "mpos/activity/activity_class.hpp"
#include "mpos/intent/intent.hpp"

namespace mpos {

inline constexpr std::string_view kChooserClassName = "mpos.Chooser";
inline constexpr std::string_view kChooserCandidatesKey = "candidates";
inline constexpr std::string_view kChooserActionKey = "action";

// Built-in activity shown when an implicit intent has several handlers.
// Its intent payload lists the candidate names under "candidates"; picking
// one re-dispatches the original intent as an explicit intent.
class ChooserActivity : public Activity {
 public:
  ChooserActivity(std::vector<ActivityClass> candidates, Intent original);

  [[nodiscard]] auto Candidates() const -> const std::vector<ActivityClass>& {
    return candidates_;
  }
  [[nodiscard]] auto Original() const -> const Intent& {
    return original_;
  }

  // Returns false when the index is out of range or this chooser is no
  // longer on top; nothing happens in either case.
  auto Choose(size_t index) -> bool;

 protected:
  void OnCreate() override;

 private:
  std::vector<ActivityClass> candidates_;
  Intent original_;
};

}  // namespace mpos
