#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "mpos/common/diagnostic/diagnostic.hpp"

namespace mpos {

// Collects non-fatal diagnostics. Not thread-safe: only the UI thread
// reports into it. Diagnostics are stored in order of reporting.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(DiagCode code, std::string msg) {
    Report(Diagnostic::Error(code, std::move(msg)));
  }

  void Warning(DiagCode code, std::string msg) {
    Report(Diagnostic::Warning(code, std::move(msg)));
  }

  void Note(DiagCode code, std::string msg) {
    Report(Diagnostic::Note(code, std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto Count(DiagCode code) const -> size_t {
    size_t count = 0;
    for (const auto& diag : diagnostics_) {
      if (diag.primary.code == code) {
        ++count;
      }
    }
    return count;
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace mpos
