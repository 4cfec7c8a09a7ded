#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace mpos {

class Activity;

using ActivityFactory = std::function<std::unique_ptr<Activity>()>;

// A launchable activity type: a stable name plus a factory producing a fresh
// instance per launch. Identity is the name; two classes with the same name
// are the same class as far as the registry and intents are concerned.
struct ActivityClass {
  std::string name;
  ActivityFactory factory;

  auto operator==(const ActivityClass& other) const -> bool {
    return name == other.name;
  }
};

template <typename T>
auto MakeActivityClass(std::string name) -> ActivityClass {
  return ActivityClass{
      .name = std::move(name),
      .factory = []() -> std::unique_ptr<Activity> {
        return std::make_unique<T>();
      },
  };
}

}  // namespace mpos
