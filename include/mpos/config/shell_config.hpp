#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/logger.hpp"
#include "mpos/runtime/ui_thread.hpp"

namespace mpos::config {

struct ShellConfig {
  // [shell]
  std::filesystem::path apps_dir = "apps";
  std::string launcher_action = "main";
  std::string launcher_category = "launcher";

  // [log]
  LogLevel log_level = LogLevel::kInfo;

  // [ui]
  size_t queue_capacity = runtime::UiThread::kDefaultCapacity;

  // Directory where mpos.toml was found
  std::filesystem::path root_dir;
};

// Search for mpos.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse mpos.toml. Every section is optional; relative apps_dir is resolved
// against the config file's directory.
// Returns a kConfig host error on parse errors or invalid values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ShellConfig>;

}  // namespace mpos::config
