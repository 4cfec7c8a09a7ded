#pragma once

#include <string>
#include <vector>

#include "mpos/activity/activity.hpp"
#include "mpos/package/activity_class_table.hpp"
#include "mpos/package/app_manifest.hpp"

namespace mpos::driver {

// Activity with no behavior of its own beyond naming its surface. Used for
// the shell's demo apps and for manifest classes the binary does not ship.
class ShellActivity : public Activity {
 protected:
  void OnCreate() override;
};

// Opens whatever the intent's "uri" names.
class ViewerActivity : public ShellActivity {
 protected:
  void OnCreate() override;
};

// Adds the shell's activity classes to `classes` and installs a fallback
// that builds a ShellActivity for any other name.
void RegisterBuiltinClasses(ActivityClassTable& classes);

// Launcher, viewer, share, email and picker apps, in installation order.
auto BuiltinApps(const std::string& launcher_action,
                 const std::string& launcher_category)
    -> std::vector<AppManifest>;

}  // namespace mpos::driver
