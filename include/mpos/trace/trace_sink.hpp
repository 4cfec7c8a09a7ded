#pragma once

#include "mpos/trace/lifecycle_event.hpp"

namespace mpos::trace {

class TraceSink {
 public:
  virtual ~TraceSink() = default;
  virtual void OnEvent(const LifecycleEvent& event) = 0;
};

}  // namespace mpos::trace
