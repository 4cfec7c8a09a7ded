#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mpos/common/diagnostic/diagnostic.hpp"

namespace mpos {

struct IntentFilter {
  std::string action;
  // Empty matches any category.
  std::string category;
};

struct ActivityEntry {
  std::string class_name;
  std::string label;
  bool exported = true;
  std::vector<IntentFilter> filters;
};

// Contents of an app's manifest.toml:
//
//   [app]
//   id = "com.example.share"
//   name = "Share"
//   version = "1.0.0"
//
//   [[activity]]
//   class = "ShareActivity"
//   label = "Share"
//
//   [[activity.intent_filter]]
//   action = "SEND"
//   category = "default"
struct AppManifest {
  std::string id;
  std::string name;
  std::string version = "0.0.0";
  std::vector<ActivityEntry> activities;

  // Directory the manifest was read from; empty for built-in apps.
  std::filesystem::path root_dir;
};

// Parse manifest.toml. Failures are kManifest host errors naming the file.
auto LoadManifest(const std::filesystem::path& manifest_path)
    -> Result<AppManifest>;

// Same, from TOML text; `origin` names the source in error messages.
auto ParseManifest(std::string_view text, std::string_view origin)
    -> Result<AppManifest>;

}  // namespace mpos
