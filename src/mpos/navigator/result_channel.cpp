#include "mpos/navigator/result_channel.hpp"

#include <optional>
#include <utility>

#include "mpos/common/internal_error.hpp"

namespace mpos {

void ResultChannel::Bind(
    LaunchId launched, LaunchId caller, ResultCallback callback) {
  auto [it, inserted] = entries_.try_emplace(
      launched, Entry{.caller = caller, .callback = std::move(callback)});
  if (!inserted) {
    common::ThrowInternalError(
        "ResultChannel::Bind", "launch already has a pending result callback");
  }
}

auto ResultChannel::Take(LaunchId launched) -> std::optional<Entry> {
  auto it = entries_.find(launched);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  Entry entry = std::move(it->second);
  entries_.erase(it);
  return entry;
}

auto ResultChannel::Discard(LaunchId launched) -> bool {
  return entries_.erase(launched) > 0;
}

}  // namespace mpos
