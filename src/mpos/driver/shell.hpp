#pragma once

#include <cstdio>
#include <memory>

#include "mpos/activity/surface.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/logger.hpp"
#include "mpos/config/shell_config.hpp"
#include "mpos/navigator/activity_navigator.hpp"
#include "mpos/navigator/activity_registry.hpp"
#include "mpos/package/activity_class_table.hpp"
#include "mpos/package/app_manager.hpp"

namespace mpos::driver {

// Everything one `mpos` invocation needs, wired together. Construction only
// builds the objects; Install() fills the registry and Launch() puts the
// launcher activity on screen.
class Shell {
 public:
  explicit Shell(config::ShellConfig config);
  ~Shell();

  Shell(const Shell&) = delete;
  Shell& operator=(const Shell&) = delete;
  Shell(Shell&&) = delete;
  Shell& operator=(Shell&&) = delete;

  // Built-in apps, then apps discovered under the configured apps_dir (if
  // it exists).
  auto Install() -> Result<void>;

  // Prints hooks, results and presented surfaces to `out` from now on.
  void EnableTrace(FILE* out);

  // Starts the first launcher entry.
  auto Launch() -> Result<void>;

  [[nodiscard]] auto Config() const -> const config::ShellConfig& {
    return config_;
  }
  [[nodiscard]] auto GetLogger() -> Logger& {
    return logger_;
  }
  [[nodiscard]] auto Registry() -> ActivityRegistry& {
    return registry_;
  }
  [[nodiscard]] auto Apps() -> AppManager& {
    return apps_;
  }
  [[nodiscard]] auto Navigator() -> ActivityNavigator& {
    return navigator_;
  }

 private:
  config::ShellConfig config_;
  Logger logger_;
  ActivityRegistry registry_;
  ActivityClassTable classes_;
  AppManager apps_;
  ActivityNavigator navigator_;
  std::unique_ptr<SurfaceHost> host_;
};

}  // namespace mpos::driver
