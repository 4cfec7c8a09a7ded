#include "mpos/intent/intent.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace mpos {

auto Intent::Explicit(ActivityClass target) -> Intent {
  Intent intent;
  intent.target_ = std::move(target);
  return intent;
}

auto Intent::Implicit(std::string action) -> Intent {
  Intent intent;
  intent.action_ = std::move(action);
  return intent;
}

auto Intent::SetTarget(ActivityClass target) -> Intent& {
  target_ = std::move(target);
  return *this;
}

auto Intent::SetAction(std::string action) -> Intent& {
  action_ = std::move(action);
  return *this;
}

auto Intent::Put(std::string key, Value value) -> Intent& {
  payload_[std::move(key)] = std::move(value);
  return *this;
}

auto Intent::Put(std::string key, const char* value) -> Intent& {
  if (value == nullptr) {
    return Put(std::move(key), Value{});
  }
  return Put(std::move(key), Value(std::string(value)));
}

auto Intent::AddFlag(std::string name, Value value) -> Intent& {
  flags_[std::move(name)] = std::move(value);
  return *this;
}

auto Intent::HasFlag(std::string_view name) const -> bool {
  auto it = flags_.find(std::string(name));
  return it != flags_.end() && IsTruthy(it->second);
}

auto Intent::Get(std::string_view key) const -> const Value* {
  auto it = payload_.find(std::string(key));
  if (it == payload_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto Intent::Validate() const -> Result<void> {
  if (!target_ && !action_) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kInvalidIntent,
            "intent has neither a target class nor an action"));
  }
  return {};
}

auto Intent::Describe() const -> std::string {
  std::string out = "Intent(";
  bool first = true;
  auto field = [&](std::string_view name, const std::string& value) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += fmt::format("{}={}", name, value);
  };
  if (target_) {
    field("target", target_->name);
  }
  if (action_) {
    field("action", *action_);
  }
  if (!payload_.empty()) {
    field("payload", FormatBundle(payload_));
  }
  if (!flags_.empty()) {
    field("flags", FormatBundle(flags_));
  }
  out += ")";
  return out;
}

}  // namespace mpos
