#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "mpos/common/logger.hpp"
#include "print.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("mpos", "0.1.0");
  program.add_description("Activity and intent navigation shell");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--log-level")
      .help("Log level: off, error, warn, info, debug or trace")
      .metavar("level");

  // Subcommand: apps
  argparse::ArgumentParser apps_cmd("apps");
  apps_cmd.add_description("List installed apps and their intent filters");

  // Subcommand: resolve
  argparse::ArgumentParser resolve_cmd("resolve");
  resolve_cmd.add_description("Print the activities handling an action");
  resolve_cmd.add_argument("action").help("Intent action");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Boot the shell and run a navigation script");
  run_cmd.add_argument("script").help("Script file");
  run_cmd.add_argument("--summary")
      .default_value(false)
      .implicit_value(true)
      .help("Print lifecycle hook counts at the end");

  program.add_subparser(apps_cmd);
  program.add_subparser(resolve_cmd);
  program.add_subparser(run_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    mpos::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  mpos::driver::CommandOptions options;
  if (auto level = program.present("--log-level")) {
    options.log_level = mpos::ParseLogLevel(*level);
    if (!options.log_level) {
      mpos::driver::PrintError(fmt::format("unknown log level '{}'", *level));
      return 1;
    }
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      mpos::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("apps")) {
      return mpos::driver::AppsCommand(options);
    }

    if (program.is_subcommand_used("resolve")) {
      return mpos::driver::ResolveCommand(
          options, resolve_cmd.get<std::string>("action"));
    }

    if (program.is_subcommand_used("run")) {
      return mpos::driver::RunScriptCommand(
          options, run_cmd.get<std::string>("script"),
          run_cmd.get<bool>("--summary"));
    }
  } catch (const std::exception& e) {
    mpos::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
