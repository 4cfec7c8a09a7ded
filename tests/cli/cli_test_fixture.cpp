#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace mpos::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Execute command and capture output
// Uses popen to capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

}  // namespace

void CliTestFixture::SetUp() {
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = tmp / ("mpos_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);

  // CTest sets MPOS_BIN to the built binary
  const char* bin = std::getenv("MPOS_BIN");
  if (bin != nullptr && *bin != '\0') {
    mpos_bin_ = bin;
  } else {
    mpos_bin_ = "mpos";
  }
}

void CliTestFixture::TearDown() {
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(std::initializer_list<std::string> args) -> CliResult {
  return RunImpl(test_dir_, std::vector<std::string>(args));
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunImpl(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, std::initializer_list<std::string> args)
    -> CliResult {
  return RunImpl(dir, std::vector<std::string>(args));
}

auto CliTestFixture::RunImpl(
    const std::filesystem::path& working_dir,
    const std::vector<std::string>& args) -> CliResult {
  std::ostringstream cmd;
  cmd << "cd '" << working_dir.string() << "' && '" << mpos_bin_.string()
      << "'";
  for (const auto& arg : args) {
    // Simple escaping for shell
    cmd << " '" << arg << "'";
  }
  // Redirect stderr to stdout so we capture both
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());
  return CliResult{.exit_code = exit_code, .combined_output = output};
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteConfig(const std::string& content) {
  WriteFile("mpos.toml", content);
}

void CliTestFixture::WriteManifest(
    const std::string& dir, const std::string& id,
    const std::string& class_name, const std::string& action) {
  WriteFile(
      std::filesystem::path("apps") / dir / "manifest.toml",
      fmt::format(
          R"([app]
id = "{}"
version = "1.0.0"

[[activity]]
class = "{}"

[[activity.intent_filter]]
action = "{}"
category = "default"
)",
          id, class_name, action));
}

}  // namespace mpos::test
