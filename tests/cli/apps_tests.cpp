#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace mpos::test {
namespace {

class AppsTest : public CliTestFixture {};

// Test: mpos apps lists the built-in apps with their filters
TEST_F(AppsTest, ListsBuiltinApps) {
  auto result = Run({"apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("mpos.launcher 1.0.0 (Launcher)"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("  ViewerActivity [VIEW/default]"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("  EmailActivity [SEND/default, main/launcher]"))
      << result.combined_output;
}

// Test: apps found under apps/ are listed after the built-ins
TEST_F(AppsTest, ListsDiscoveredApps) {
  WriteManifest("notes", "com.example.notes", "NotesActivity", "EDIT");

  auto result = Run({"apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("com.example.notes 1.0.0 (com.example.notes)"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("  NotesActivity [EDIT/default]"))
      << result.combined_output;
  EXPECT_LT(
      result.combined_output.find("mpos.picker"),
      result.combined_output.find("com.example.notes"));
}

// Test: private activities are marked
TEST_F(AppsTest, MarksPrivateActivities) {
  WriteFile(
      "apps/secret/manifest.toml",
      "[app]\nid = \"secret\"\n\n[[activity]]\nclass = \"Hidden\"\n"
      "exported = false\n");

  auto result = Run({"apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("  Hidden (private) []"))
      << result.combined_output;
}

// Test: a broken manifest is reported but does not stop the listing
TEST_F(AppsTest, BrokenManifestIsReported) {
  WriteFile("apps/broken/manifest.toml", "[app]\nname = \"x\"\n");

  auto result = Run({"apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("missing required field 'app.id'"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("mpos.viewer")) << result.combined_output;
}

// Test: apps_dir from mpos.toml is honored
TEST_F(AppsTest, ConfigChangesAppsDir) {
  WriteConfig("[shell]\napps_dir = \"installed\"\n");
  WriteFile(
      "installed/notes/manifest.toml", "[app]\nid = \"from.config\"\n");

  auto result = Run({"apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("from.config")) << result.combined_output;
}

// Test: -C runs as if started in another directory
TEST_F(AppsTest, ChangeDirectoryFlag) {
  WriteFile("sub/apps/notes/manifest.toml", "[app]\nid = \"in.sub\"\n");

  auto result = Run({"-C", "sub", "apps"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("in.sub")) << result.combined_output;
}

// Test: -C to a missing directory fails
TEST_F(AppsTest, ChangeDirectoryToMissingDirFails) {
  auto result = Run({"-C", "nowhere", "apps"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("cannot change to 'nowhere'"))
      << result.combined_output;
}

// Test: an invalid mpos.toml is a hard error
TEST_F(AppsTest, InvalidConfigFails) {
  WriteConfig("[log]\nlevel = \"loud\"\n");

  auto result = Run({"apps"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("unknown log level 'loud'"))
      << result.combined_output;
}

}  // namespace
}  // namespace mpos::test
