#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace mpos {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Caller error (bad intent, bad choice)
  kHostError,  // I/O, malformed config or manifest
  kWarning,    // Non-fatal, the operation became a no-op
  kNote,       // Auxiliary message
};

// What went wrong. Kept separate from the kind so tests and tools can match
// on a stable code instead of message text.
enum class DiagCode : uint8_t {
  kNone,
  kInvalidIntent,
  kNoHandler,
  kStaleActivityIgnored,
  kDoubleFinishIgnored,
  kInvalidChoice,
  kUnknownActivityClass,
  kNotAttached,
  kConfig,
  kManifest,
  kScript,
};

auto DiagCodeName(DiagCode code) -> const char*;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagCode code;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Code() const -> DiagCode {
    return primary.code;
  }

  // Factory: caller error
  static auto Error(DiagCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError, .code = code, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error (config file, manifest, filesystem)
  static auto HostError(DiagCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .code = code,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(DiagCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .code = code,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: standalone note (recovered-locally conditions)
  static auto Note(DiagCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kNote, .code = code, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .code = DiagCode::kNone,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace mpos
