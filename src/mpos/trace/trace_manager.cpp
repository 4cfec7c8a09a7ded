#include "mpos/trace/trace_manager.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "mpos/common/overloaded.hpp"

namespace mpos::trace {

void TraceManager::AddSink(std::unique_ptr<TraceSink> sink) {
  sinks_.push_back(std::move(sink));
}

void TraceManager::EmitHook(
    LaunchId launch, const std::string& class_name, Hook hook) {
  Record(HookCalled{.launch = launch, .class_name = class_name, .hook = hook});
}

void TraceManager::EmitStackChanged(size_t depth) {
  Record(StackChanged{.depth = depth});
}

void TraceManager::EmitResultDelivered(
    LaunchId launch, const std::string& class_name,
    const std::string& result_code) {
  Record(
      ResultDelivered{
          .launch = launch,
          .class_name = class_name,
          .result_code = result_code});
}

void TraceManager::EmitChooserShown(std::vector<std::string> candidates) {
  Record(ChooserShown{.candidates = std::move(candidates)});
}

auto TraceManager::Events() const -> const std::vector<LifecycleEvent>& {
  return events_;
}

auto TraceManager::HookTrace() const -> std::vector<std::string> {
  std::vector<std::string> trace;
  for (const auto& event : events_) {
    if (const auto* hook = std::get_if<HookCalled>(&event)) {
      trace.push_back(
          fmt::format("{}.{}", hook->class_name, HookName(hook->hook)));
    }
  }
  return trace;
}

auto TraceManager::CountHooks(std::string_view class_name, Hook hook) const
    -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (const auto* hc = std::get_if<HookCalled>(&event)) {
      if (hc->class_name == class_name && hc->hook == hook) {
        ++count;
      }
    }
  }
  return count;
}

void TraceManager::PrintSummary(FILE* sink) const {
  std::array<size_t, 6> hook_counts{};
  size_t results = 0;
  size_t choosers = 0;
  size_t max_depth = 0;

  for (const auto& event : events_) {
    std::visit(
        Overloaded{
            [&](const HookCalled& e) {
              ++hook_counts.at(static_cast<size_t>(e.hook));
            },
            [&](const StackChanged& e) {
              max_depth = std::max(max_depth, e.depth);
            },
            [&](const ResultDelivered&) { ++results; },
            [&](const ChooserShown&) { ++choosers; },
        },
        event);
  }

  std::string line = "hooks:";
  for (size_t i = 0; i < hook_counts.size(); ++i) {
    line += fmt::format(
        " {}={}", HookName(static_cast<Hook>(i)), hook_counts.at(i));
  }
  fmt::print(sink, "{}\n", line);
  fmt::print(
      sink, "results={} choosers={} max_depth={}\n", results, choosers,
      max_depth);
}

void TraceManager::Record(LifecycleEvent event) {
  if (!enabled_) return;
  for (const auto& sink : sinks_) {
    sink->OnEvent(event);
  }
  events_.push_back(std::move(event));
}

}  // namespace mpos::trace
