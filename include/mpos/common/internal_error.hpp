#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace mpos::common {

// Exception type for broken engine invariants (bugs in mpos or in an
// activity factory, not caller errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace mpos::common
