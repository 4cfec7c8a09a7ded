#pragma once

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "mpos/trace/lifecycle_event.hpp"
#include "mpos/trace/trace_sink.hpp"

namespace mpos::trace {

// Records what the navigator did, in order. Disabled by default; when
// disabled nothing is recorded and sinks see nothing.
class TraceManager {
 public:
  void SetEnabled(bool enabled) {
    enabled_ = enabled;
  }
  [[nodiscard]] bool IsEnabled() const {
    return enabled_;
  }

  void AddSink(std::unique_ptr<TraceSink> sink);

  void EmitHook(LaunchId launch, const std::string& class_name, Hook hook);
  void EmitStackChanged(size_t depth);
  void EmitResultDelivered(
      LaunchId launch, const std::string& class_name,
      const std::string& result_code);
  void EmitChooserShown(std::vector<std::string> candidates);

  [[nodiscard]] auto Events() const -> const std::vector<LifecycleEvent>&;

  // Hook calls only, as "Class.onHook" strings.
  [[nodiscard]] auto HookTrace() const -> std::vector<std::string>;
  [[nodiscard]] auto CountHooks(std::string_view class_name, Hook hook) const
      -> size_t;

  void Clear() {
    events_.clear();
  }

  // One line per hook kind:
  //   hooks: onCreate=3 onStart=3 onResume=4 onPause=2 onStop=2 onDestroy=1
  //   results=1 choosers=0 max_depth=3
  void PrintSummary(FILE* sink = stdout) const;

 private:
  void Record(LifecycleEvent event);

  bool enabled_ = false;
  std::vector<LifecycleEvent> events_;
  std::vector<std::unique_ptr<TraceSink>> sinks_;
};

}  // namespace mpos::trace
