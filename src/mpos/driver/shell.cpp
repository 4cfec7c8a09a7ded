#include "shell.hpp"

#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "builtin_apps.hpp"
#include "mpos/common/overloaded.hpp"
#include "mpos/intent/intent.hpp"
#include "mpos/trace/trace_sink.hpp"
#include "print.hpp"

namespace mpos::driver {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "shell";

class PrintingTraceSink : public trace::TraceSink {
 public:
  explicit PrintingTraceSink(FILE* out) : out_(out) {
  }

  void OnEvent(const trace::LifecycleEvent& event) override {
    std::visit(
        Overloaded{
            [&](const trace::HookCalled& e) {
              fmt::print(
                  out_, "  {}#{}.{}\n", e.class_name, e.launch.value,
                  trace::HookName(e.hook));
            },
            [&](const trace::StackChanged&) {},
            [&](const trace::ResultDelivered& e) {
              fmt::print(
                  out_, "  result {} from {}#{}\n", e.result_code,
                  e.class_name, e.launch.value);
            },
            [&](const trace::ChooserShown& e) {
              fmt::print(
                  out_, "  chooser [{}]\n", fmt::join(e.candidates, ", "));
            },
        },
        event);
  }

 private:
  FILE* out_;
};

class PrintingSurfaceHost : public SurfaceHost {
 public:
  explicit PrintingSurfaceHost(FILE* out) : out_(out) {
  }

  void Present(Surface& surface, bool animate) override {
    fmt::print(
        out_, "  present {}{}\n", surface.Name(),
        animate ? "" : " (no animation)");
  }

  void Release(Surface& surface) override {
    fmt::print(out_, "  release {}\n", surface.Name());
  }

 private:
  FILE* out_;
};

}  // namespace

Shell::Shell(config::ShellConfig config)
    : config_(std::move(config)),
      logger_(config_.log_level),
      apps_(registry_, classes_, logger_),
      navigator_(registry_, logger_, config_.queue_capacity) {
  RegisterBuiltinClasses(classes_);
}

Shell::~Shell() {
  navigator_.Shutdown();
  logger_.Flush();
}

auto Shell::Install() -> Result<void> {
  for (auto& app :
       BuiltinApps(config_.launcher_action, config_.launcher_category)) {
    apps_.RegisterBuiltin(std::move(app));
  }

  std::error_code ec;
  if (fs::is_directory(config_.apps_dir, ec)) {
    auto discovered = apps_.Discover(config_.apps_dir);
    if (!discovered) {
      return std::unexpected(discovered.error());
    }
  } else {
    logger_.Debug(
        kTag, "no apps directory at {}; built-in apps only",
        config_.apps_dir.string());
  }

  PrintDiagnostics(apps_.Diagnostics());
  return {};
}

void Shell::EnableTrace(FILE* out) {
  navigator_.Trace().SetEnabled(true);
  navigator_.Trace().AddSink(std::make_unique<PrintingTraceSink>(out));
  host_ = std::make_unique<PrintingSurfaceHost>(out);
  navigator_.SetSurfaceHost(host_.get());
}

auto Shell::Launch() -> Result<void> {
  auto entries =
      apps_.LauncherEntries(config_.launcher_action, config_.launcher_category);
  if (entries.empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            DiagCode::kConfig,
            fmt::format(
                "no launcher activity for action '{}' in category '{}'",
                config_.launcher_action, config_.launcher_category))
            .WithNote(
                "check shell.launcher_action and shell.launcher_category "
                "against the installed manifests"));
  }

  auto launcher = apps_.FindClass(entries.front().class_name);
  if (!launcher) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kUnknownActivityClass,
            fmt::format(
                "unknown launcher class '{}'", entries.front().class_name)));
  }

  auto outcome = navigator_.StartActivity(Intent::Explicit(*launcher));
  if (!outcome) {
    return std::unexpected(outcome.error());
  }
  return {};
}

}  // namespace mpos::driver
