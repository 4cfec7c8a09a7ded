#pragma once

#include <optional>
#include <string>

#include "mpos/common/logger.hpp"

namespace mpos::driver {

struct CommandOptions {
  // --log-level; overrides mpos.toml when set
  std::optional<LogLevel> log_level;
};

auto AppsCommand(const CommandOptions& options) -> int;
auto ResolveCommand(const CommandOptions& options, const std::string& action)
    -> int;
auto RunScriptCommand(
    const CommandOptions& options, const std::string& script_path,
    bool summary) -> int;

}  // namespace mpos::driver
