#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/intent/bundle.hpp"
#include "mpos/intent/intent.hpp"
#include "shell.hpp"

namespace mpos::driver {

// One line of a navigation script.
struct ScriptCommand {
  size_t line = 0;
  std::string verb;
  std::vector<std::string> args;
};

// Script syntax, one command per line, '#' starts a comment:
//   start <Class> [key=value ...] [+flag ...]
//   action <ACTION> [key=value ...] [+flag ...]
//   start-for-result <Class|action:ACTION> [key=value ...] [+flag ...]
//   choose <index>
//   finish [code [key=value ...]]
//   back | background | foreground | stack
auto ParseScript(std::string_view text, std::string_view origin)
    -> Result<std::vector<ScriptCommand>>;
auto LoadScript(const std::filesystem::path& path)
    -> Result<std::vector<ScriptCommand>>;

// "true"/"false" become bool, "null" monostate, numbers int64 or double,
// anything else a string.
auto ParseValue(std::string_view text) -> Value;

// Executes commands against a launched shell, echoing each one to `out`.
// Stops at the first failing command.
class ScriptRunner {
 public:
  ScriptRunner(Shell& shell, FILE* out, std::string origin);

  auto Run(const std::vector<ScriptCommand>& commands) -> Result<void>;

 private:
  auto Execute(const ScriptCommand& command) -> Result<void>;
  auto BuildIntent(
      const ScriptCommand& command, std::string_view target, bool implicit)
      -> Result<Intent>;
  auto Fail(const ScriptCommand& command, std::string_view detail) const
      -> Diagnostic;

  Shell& shell_;
  FILE* out_;
  std::string origin_;
};

}  // namespace mpos::driver
