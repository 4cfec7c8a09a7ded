#pragma once

#include <cstddef>
#include <map>
#include <optional>

#include "mpos/activity/activity_result.hpp"
#include "mpos/activity/launch_id.hpp"

namespace mpos {

// Pending result callbacks, keyed by the launch that will produce the
// result. Owned and mutated by the ActivityNavigator only.
class ResultChannel {
 public:
  struct Entry {
    LaunchId caller;  // Invalid when launched from outside any activity
    ResultCallback callback;
  };

  void Bind(LaunchId launched, LaunchId caller, ResultCallback callback);

  // Removes and returns the entry; at most one Take succeeds per launch.
  auto Take(LaunchId launched) -> std::optional<Entry>;

  // Returns true if an entry was dropped.
  auto Discard(LaunchId launched) -> bool;

  [[nodiscard]] auto Contains(LaunchId launched) const -> bool {
    return entries_.contains(launched);
  }
  [[nodiscard]] auto Pending() const -> size_t {
    return entries_.size();
  }

 private:
  std::map<LaunchId, Entry> entries_;
};

}  // namespace mpos
