#include "mpos/common/diagnostic/diagnostic.hpp"

namespace mpos {

auto DiagCodeName(DiagCode code) -> const char* {
  switch (code) {
    case DiagCode::kNone:
      return "none";
    case DiagCode::kInvalidIntent:
      return "invalid-intent";
    case DiagCode::kNoHandler:
      return "no-handler";
    case DiagCode::kStaleActivityIgnored:
      return "stale-activity-ignored";
    case DiagCode::kDoubleFinishIgnored:
      return "double-finish-ignored";
    case DiagCode::kInvalidChoice:
      return "invalid-choice";
    case DiagCode::kUnknownActivityClass:
      return "unknown-activity-class";
    case DiagCode::kNotAttached:
      return "not-attached";
    case DiagCode::kConfig:
      return "config";
    case DiagCode::kManifest:
      return "manifest";
    case DiagCode::kScript:
      return "script";
  }
  return "none";
}

}  // namespace mpos
