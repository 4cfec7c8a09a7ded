#pragma once

#include <compare>
#include <cstdint>

namespace mpos {

// Identifies one launch of an activity (one stack entry). Never reused within
// a navigator, so a stale id can always be told apart from the current top.
struct LaunchId {
  uint32_t value;

  static constexpr auto Invalid() -> LaunchId {
    return {UINT32_MAX};
  }
  [[nodiscard]] auto IsValid() const -> bool {
    return value != UINT32_MAX;
  }

  auto operator==(const LaunchId&) const -> bool = default;
  auto operator<=>(const LaunchId&) const = default;
};

}  // namespace mpos
