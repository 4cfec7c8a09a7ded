#include "mpos/package/app_manager.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace mpos {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "apps";
constexpr std::string_view kManifestFile = "manifest.toml";

}  // namespace

AppManager::AppManager(
    ActivityRegistry& registry, const ActivityClassTable& classes,
    Logger& logger)
    : registry_(registry), classes_(classes), logger_(logger) {
}

auto AppManager::Discover(const fs::path& apps_dir) -> Result<size_t> {
  std::error_code ec;
  if (!fs::is_directory(apps_dir, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            DiagCode::kManifest,
            fmt::format("apps directory not found: {}", apps_dir.string())));
  }

  std::vector<fs::path> app_dirs;
  for (const auto& entry : fs::directory_iterator(apps_dir, ec)) {
    if (entry.is_directory() && fs::exists(entry.path() / kManifestFile)) {
      app_dirs.push_back(entry.path());
    }
  }
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            DiagCode::kManifest,
            fmt::format(
                "cannot read apps directory {}: {}", apps_dir.string(),
                ec.message())));
  }
  std::ranges::sort(app_dirs);

  size_t installed = 0;
  for (const auto& dir : app_dirs) {
    auto manifest = LoadManifest(dir / kManifestFile);
    if (!manifest) {
      logger_.Warn(kTag, "skipping app: {}", manifest.error().primary.message);
      diagnostics_.Report(manifest.error());
      continue;
    }
    if (Install(std::move(*manifest))) {
      ++installed;
    }
  }

  logger_.Info(
      kTag, "discovered {} apps in {}", installed, apps_dir.string());
  return installed;
}

auto AppManager::RegisterBuiltin(AppManifest manifest) -> bool {
  return Install(std::move(manifest));
}

auto AppManager::Install(AppManifest manifest) -> bool {
  if (FindApp(manifest.id) != nullptr) {
    std::string message =
        fmt::format("duplicate app id '{}' ignored", manifest.id);
    logger_.Warn(kTag, "{}", message);
    diagnostics_.Warning(DiagCode::kManifest, std::move(message));
    return false;
  }

  std::vector<ActivityEntry> resolved;
  for (auto& activity : manifest.activities) {
    auto activity_class = classes_.Find(activity.class_name);
    if (!activity_class) {
      std::string message = fmt::format(
          "app '{}': unknown activity class '{}'", manifest.id,
          activity.class_name);
      logger_.Warn(kTag, "{}", message);
      diagnostics_.Warning(DiagCode::kUnknownActivityClass, std::move(message));
      continue;
    }

    if (activity.exported) {
      for (const auto& filter : activity.filters) {
        if (registry_.Register(filter.action, *activity_class)) {
          logger_.Debug(
              kTag, "{} handles '{}'", activity.class_name, filter.action);
        }
      }
    }
    resolved.push_back(std::move(activity));
  }
  manifest.activities = std::move(resolved);

  logger_.Debug(
      kTag, "installed {} {} ({} activities)", manifest.id, manifest.version,
      manifest.activities.size());
  apps_.push_back(std::move(manifest));
  return true;
}

auto AppManager::FindApp(std::string_view id) const -> const AppManifest* {
  auto it = std::ranges::find_if(
      apps_, [id](const AppManifest& app) { return app.id == id; });
  if (it == apps_.end()) {
    return nullptr;
  }
  return &*it;
}

auto AppManager::LauncherEntries(
    std::string_view action, std::string_view category) const
    -> std::vector<LauncherEntry> {
  std::vector<LauncherEntry> entries;
  for (const auto& app : apps_) {
    for (const auto& activity : app.activities) {
      bool matches = std::ranges::any_of(
          activity.filters, [&](const IntentFilter& filter) {
            return filter.action == action &&
                   (category.empty() || filter.category == category);
          });
      if (!matches) continue;
      entries.push_back(
          LauncherEntry{
              .app_id = app.id,
              .app_name = app.name,
              .class_name = activity.class_name,
              .label = activity.label,
          });
    }
  }
  return entries;
}

auto AppManager::FindClass(std::string_view class_name) const
    -> std::optional<ActivityClass> {
  return classes_.Find(class_name);
}

}  // namespace mpos
