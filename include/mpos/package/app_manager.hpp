#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mpos/activity/activity_class.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/diagnostic/diagnostic_sink.hpp"
#include "mpos/common/logger.hpp"
#include "mpos/navigator/activity_registry.hpp"
#include "mpos/package/activity_class_table.hpp"
#include "mpos/package/app_manifest.hpp"

namespace mpos {

// An activity the home screen can list.
struct LauncherEntry {
  std::string app_id;
  std::string app_name;
  std::string class_name;
  std::string label;
};

// Installs apps into the registry.
//
// Each app is described by a manifest; every exported activity's intent
// filters are registered as actions. Activities naming a class that the
// class table cannot produce are skipped with a kUnknownActivityClass
// warning. Installation order is discovery order (subdirectories sorted by
// name), which fixes candidate order in the registry.
class AppManager {
 public:
  AppManager(
      ActivityRegistry& registry, const ActivityClassTable& classes,
      Logger& logger);

  // Scans `apps_dir` for subdirectories holding a manifest.toml and installs
  // each. Broken manifests are reported to Diagnostics() and skipped. Fails
  // only when `apps_dir` itself is unusable. Returns the number of apps
  // installed by this call.
  auto Discover(const std::filesystem::path& apps_dir) -> Result<size_t>;

  // Installs an app described in code. Returns false on a duplicate id.
  auto RegisterBuiltin(AppManifest manifest) -> bool;

  [[nodiscard]] auto Apps() const -> const std::vector<AppManifest>& {
    return apps_;
  }
  [[nodiscard]] auto FindApp(std::string_view id) const -> const AppManifest*;

  // Installed activities with a filter for `action`; an empty `category`
  // matches any filter category.
  [[nodiscard]] auto LauncherEntries(
      std::string_view action, std::string_view category) const
      -> std::vector<LauncherEntry>;

  // Class lookup for explicit launches by name.
  [[nodiscard]] auto FindClass(std::string_view class_name) const
      -> std::optional<ActivityClass>;

  [[nodiscard]] auto Diagnostics() const -> const DiagnosticSink& {
    return diagnostics_;
  }

 private:
  auto Install(AppManifest manifest) -> bool;

  ActivityRegistry& registry_;
  const ActivityClassTable& classes_;
  Logger& logger_;
  DiagnosticSink diagnostics_;
  std::vector<AppManifest> apps_;
};

}  // namespace mpos
