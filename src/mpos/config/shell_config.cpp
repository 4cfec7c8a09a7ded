#include "mpos/config/shell_config.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include "mpos/common/diagnostic/diagnostic.hpp"

namespace mpos::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(const fs::path& path, std::string_view detail)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          DiagCode::kConfig, fmt::format("{}: {}", path.string(), detail)));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "mpos.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ShellConfig> {
  ShellConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            DiagCode::kConfig,
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [shell] section (optional)
  if (auto shell = tbl["shell"]) {
    if (auto apps_dir = shell["apps_dir"].value<std::string>()) {
      if (apps_dir->empty()) {
        return ConfigError(config_path, "'shell.apps_dir' must not be empty");
      }
      config.apps_dir = *apps_dir;
    }
    if (auto action = shell["launcher_action"].value<std::string>()) {
      if (action->empty()) {
        return ConfigError(
            config_path, "'shell.launcher_action' must not be empty");
      }
      config.launcher_action = *action;
    }
    if (auto category = shell["launcher_category"].value<std::string>()) {
      config.launcher_category = *category;
    }
  }
  if (config.apps_dir.is_relative()) {
    config.apps_dir = config.root_dir / config.apps_dir;
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto level = log["level"].value<std::string>()) {
      auto parsed = ParseLogLevel(*level);
      if (!parsed) {
        return ConfigError(
            config_path,
            fmt::format(
                "unknown log level '{}' (use off, error, warn, info, debug "
                "or trace)",
                *level));
      }
      config.log_level = *parsed;
    }
  }

  // [ui] section (optional)
  if (auto ui = tbl["ui"]) {
    if (auto capacity = ui["queue_capacity"].value<int64_t>()) {
      if (*capacity <= 0) {
        return ConfigError(
            config_path, "'ui.queue_capacity' must be greater than zero");
      }
      config.queue_capacity = static_cast<size_t>(*capacity);
    }
  }

  return config;
}

}  // namespace mpos::config
