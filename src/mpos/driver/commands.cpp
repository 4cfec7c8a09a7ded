#include "commands.hpp"

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "mpos/config/shell_config.hpp"
#include "print.hpp"
#include "script.hpp"
#include "shell.hpp"

namespace mpos::driver {

namespace {

// mpos.toml from the working directory upwards, or defaults when there is
// none.
auto ResolveConfig(const CommandOptions& options)
    -> std::optional<config::ShellConfig> {
  config::ShellConfig shell_config;
  if (auto path = config::FindConfig()) {
    auto loaded = config::LoadConfig(*path);
    if (!loaded) {
      PrintDiagnostic(loaded.error());
      return std::nullopt;
    }
    shell_config = std::move(*loaded);
  }
  if (options.log_level) {
    shell_config.log_level = *options.log_level;
  }
  return shell_config;
}

auto FilterText(const IntentFilter& filter) -> std::string {
  if (filter.category.empty()) {
    return filter.action;
  }
  return fmt::format("{}/{}", filter.action, filter.category);
}

}  // namespace

auto AppsCommand(const CommandOptions& options) -> int {
  auto shell_config = ResolveConfig(options);
  if (!shell_config) {
    return 1;
  }

  Shell shell(std::move(*shell_config));
  if (auto installed = shell.Install(); !installed) {
    PrintDiagnostic(installed.error());
    return 1;
  }

  for (const auto& app : shell.Apps().Apps()) {
    fmt::print("{} {} ({})\n", app.id, app.version, app.name);
    for (const auto& activity : app.activities) {
      std::vector<std::string> filters;
      for (const auto& filter : activity.filters) {
        filters.push_back(FilterText(filter));
      }
      fmt::print(
          "  {}{} [{}]\n", activity.class_name,
          activity.exported ? "" : " (private)", fmt::join(filters, ", "));
    }
  }
  return 0;
}

auto ResolveCommand(const CommandOptions& options, const std::string& action)
    -> int {
  auto shell_config = ResolveConfig(options);
  if (!shell_config) {
    return 1;
  }

  Shell shell(std::move(*shell_config));
  if (auto installed = shell.Install(); !installed) {
    PrintDiagnostic(installed.error());
    return 1;
  }

  const auto& candidates = shell.Registry().Candidates(action);
  if (candidates.empty()) {
    PrintError(fmt::format("no activity handles action '{}'", action));
    return 1;
  }
  for (size_t i = 0; i < candidates.size(); ++i) {
    fmt::print("{}: {}\n", i, candidates[i].name);
  }
  return 0;
}

auto RunScriptCommand(
    const CommandOptions& options, const std::string& script_path,
    bool summary) -> int {
  auto commands = LoadScript(script_path);
  if (!commands) {
    PrintDiagnostic(commands.error());
    return 1;
  }

  auto shell_config = ResolveConfig(options);
  if (!shell_config) {
    return 1;
  }

  Shell shell(std::move(*shell_config));
  if (auto installed = shell.Install(); !installed) {
    PrintDiagnostic(installed.error());
    return 1;
  }
  shell.EnableTrace(stdout);

  if (auto launched = shell.Launch(); !launched) {
    PrintDiagnostic(launched.error());
    return 1;
  }

  ScriptRunner runner(shell, stdout, script_path);
  auto result = runner.Run(*commands);
  if (!result) {
    std::fflush(stdout);
    PrintDiagnostic(result.error());
    return 1;
  }

  fmt::print(
      "final stack: {}\n",
      fmt::join(shell.Navigator().StackClassNames(), " > "));
  shell.Navigator().Shutdown();
  if (summary) {
    shell.Navigator().Trace().PrintSummary(stdout);
  }
  return 0;
}

}  // namespace mpos::driver
