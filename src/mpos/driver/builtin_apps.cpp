#include "builtin_apps.hpp"

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "mpos/activity/surface.hpp"
#include "mpos/intent/bundle.hpp"

namespace mpos::driver {

void ShellActivity::OnCreate() {
  SetContentView(std::make_unique<Surface>(ClassName()));
}

void ViewerActivity::OnCreate() {
  std::string name = ClassName();
  if (const Value* uri = GetIntent().Get("uri")) {
    if (const auto* text = std::get_if<std::string>(uri)) {
      name += ":" + *text;
    }
  }
  SetContentView(std::make_unique<Surface>(name));
}

void RegisterBuiltinClasses(ActivityClassTable& classes) {
  classes.Register<ShellActivity>("Launcher");
  classes.Register<ViewerActivity>("ViewerActivity");
  classes.Register<ShellActivity>("ShareActivity");
  classes.Register<ShellActivity>("EmailActivity");
  classes.Register<ShellActivity>("PickerActivity");
  classes.SetFallback(
      [](const std::string& /*class_name*/) -> std::unique_ptr<Activity> {
        return std::make_unique<ShellActivity>();
      });
}

namespace {

auto SingleActivityApp(
    std::string id, std::string name, std::string class_name,
    std::vector<IntentFilter> filters) -> AppManifest {
  AppManifest app{
      .id = std::move(id),
      .name = std::move(name),
      .version = "1.0.0",
      .activities = {},
      .root_dir = {},
  };
  app.activities.push_back(
      ActivityEntry{
          .class_name = std::move(class_name),
          .label = app.name,
          .exported = true,
          .filters = std::move(filters),
      });
  return app;
}

}  // namespace

auto BuiltinApps(const std::string& launcher_action,
                 const std::string& launcher_category)
    -> std::vector<AppManifest> {
  IntentFilter launcher{
      .action = launcher_action, .category = launcher_category};

  std::vector<AppManifest> apps;
  apps.push_back(
      SingleActivityApp(
          "mpos.launcher", "Launcher", "Launcher", {launcher}));
  apps.push_back(
      SingleActivityApp(
          "mpos.viewer", "Viewer", "ViewerActivity",
          {{.action = "VIEW", .category = "default"}}));
  apps.push_back(
      SingleActivityApp(
          "mpos.share", "Share", "ShareActivity",
          {{.action = "SEND", .category = "default"}}));
  apps.push_back(
      SingleActivityApp(
          "mpos.email", "Email", "EmailActivity",
          {{.action = "SEND", .category = "default"}, launcher}));
  apps.push_back(
      SingleActivityApp(
          "mpos.picker", "Picker", "PickerActivity",
          {{.action = "PICK", .category = "default"}}));
  return apps;
}

}  // namespace mpos::driver
