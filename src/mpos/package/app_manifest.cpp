#include "mpos/package/app_manifest.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include "mpos/common/diagnostic/diagnostic.hpp"

namespace mpos {

namespace fs = std::filesystem;

namespace {

auto ManifestError(std::string_view origin, std::string_view detail)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          DiagCode::kManifest, fmt::format("{}: {}", origin, detail)));
}

auto ParseFilter(
    const toml::table& filter, std::string_view origin, size_t activity_index,
    size_t filter_index) -> Result<IntentFilter> {
  auto action = filter["action"].value<std::string>();
  if (!action || action->empty()) {
    return ManifestError(
        origin, fmt::format(
                    "activity #{} intent_filter #{}: missing required field "
                    "'action'",
                    activity_index, filter_index));
  }
  return IntentFilter{
      .action = *action,
      .category = filter["category"].value_or(std::string{}),
  };
}

auto ParseActivity(
    const toml::table& activity, std::string_view origin, size_t index)
    -> Result<ActivityEntry> {
  auto class_name = activity["class"].value<std::string>();
  if (!class_name || class_name->empty()) {
    return ManifestError(
        origin,
        fmt::format("activity #{}: missing required field 'class'", index));
  }

  ActivityEntry entry{
      .class_name = *class_name,
      .label = activity["label"].value_or(*class_name),
      .exported = activity["exported"].value_or(true),
      .filters = {},
  };

  if (auto filters = activity["intent_filter"]) {
    const auto* arr = filters.as_array();
    if (arr == nullptr) {
      return ManifestError(
          origin, fmt::format(
                      "activity #{}: 'intent_filter' must be an array of "
                      "tables",
                      index));
    }
    for (size_t i = 0; i < arr->size(); ++i) {
      const auto* filter = (*arr)[i].as_table();
      if (filter == nullptr) {
        return ManifestError(
            origin, fmt::format(
                        "activity #{}: 'intent_filter' must be an array of "
                        "tables",
                        index));
      }
      auto parsed = ParseFilter(*filter, origin, index, i);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      entry.filters.push_back(std::move(*parsed));
    }
  }
  return entry;
}

auto ParseTable(const toml::table& tbl, std::string_view origin)
    -> Result<AppManifest> {
  const auto* app = tbl["app"].as_table();
  if (app == nullptr) {
    return ManifestError(origin, "missing [app] section");
  }

  AppManifest manifest;
  auto id = (*app)["id"].value<std::string>();
  if (!id || id->empty()) {
    return ManifestError(origin, "missing required field 'app.id'");
  }
  manifest.id = *id;
  manifest.name = (*app)["name"].value_or(*id);
  manifest.version = (*app)["version"].value_or(manifest.version);

  if (auto activities = tbl["activity"]) {
    const auto* arr = activities.as_array();
    if (arr == nullptr) {
      return ManifestError(origin, "'activity' must be an array of tables");
    }
    for (size_t i = 0; i < arr->size(); ++i) {
      const auto* activity = (*arr)[i].as_table();
      if (activity == nullptr) {
        return ManifestError(origin, "'activity' must be an array of tables");
      }
      auto parsed = ParseActivity(*activity, origin, i);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      manifest.activities.push_back(std::move(*parsed));
    }
  }

  return manifest;
}

}  // namespace

auto ParseManifest(std::string_view text, std::string_view origin)
    -> Result<AppManifest> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    return ManifestError(
        origin, fmt::format("failed to parse: {}", e.description()));
  }
  return ParseTable(tbl, origin);
}

auto LoadManifest(const fs::path& manifest_path) -> Result<AppManifest> {
  std::ifstream in(manifest_path);
  if (!in) {
    return ManifestError(manifest_path.string(), "cannot open file");
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  auto manifest = ParseManifest(ss.str(), manifest_path.string());
  if (!manifest) {
    return manifest;
  }
  manifest->root_dir = manifest_path.parent_path();
  return manifest;
}

}  // namespace mpos
