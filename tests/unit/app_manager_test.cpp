#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "mpos/activity/activity.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/logger.hpp"
#include "mpos/intent/intent.hpp"
#include "mpos/navigator/activity_registry.hpp"
#include "mpos/package/activity_class_table.hpp"
#include "mpos/package/app_manager.hpp"
#include "mpos/package/app_manifest.hpp"
#include "tests/unit/temp_dir_fixture.hpp"

namespace mpos::test {
namespace {

auto ClassNames(const std::vector<ActivityClass>& classes)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& c : classes) {
    names.push_back(c.name);
  }
  return names;
}

// =============================================================================
// Manifest parsing
// =============================================================================

TEST(AppManifestTest, ParsesAppAndActivities) {
  auto manifest = ParseManifest(
      R"(
[app]
id = "com.example.share"
name = "Share"
version = "1.2.0"

[[activity]]
class = "ShareActivity"
label = "Share it"

[[activity.intent_filter]]
action = "SEND"
category = "default"

[[activity.intent_filter]]
action = "main"

[[activity]]
class = "SettingsActivity"
exported = false
)",
      "share/manifest.toml");

  ASSERT_TRUE(manifest.has_value()) << manifest.error().primary.message;
  EXPECT_EQ(manifest->id, "com.example.share");
  EXPECT_EQ(manifest->name, "Share");
  EXPECT_EQ(manifest->version, "1.2.0");
  ASSERT_EQ(manifest->activities.size(), 2);

  const ActivityEntry& share = manifest->activities[0];
  EXPECT_EQ(share.class_name, "ShareActivity");
  EXPECT_EQ(share.label, "Share it");
  EXPECT_TRUE(share.exported);
  ASSERT_EQ(share.filters.size(), 2);
  EXPECT_EQ(share.filters[0].action, "SEND");
  EXPECT_EQ(share.filters[0].category, "default");
  EXPECT_EQ(share.filters[1].category, "");

  const ActivityEntry& settings = manifest->activities[1];
  EXPECT_EQ(settings.label, "SettingsActivity");
  EXPECT_FALSE(settings.exported);
  EXPECT_TRUE(settings.filters.empty());
}

TEST(AppManifestTest, NameAndVersionDefault) {
  auto manifest = ParseManifest("[app]\nid = \"x\"\n", "x");

  ASSERT_TRUE(manifest.has_value());
  EXPECT_EQ(manifest->name, "x");
  EXPECT_EQ(manifest->version, "0.0.0");
  EXPECT_TRUE(manifest->activities.empty());
}

struct BadManifest {
  std::string text;
  std::string fragment;
};

class BadManifestTest : public ::testing::TestWithParam<BadManifest> {};

TEST_P(BadManifestTest, IsManifestError) {
  auto manifest = ParseManifest(GetParam().text, "bad.toml");

  ASSERT_FALSE(manifest.has_value());
  EXPECT_EQ(manifest.error().Code(), DiagCode::kManifest);
  const std::string& message = manifest.error().primary.message;
  EXPECT_EQ(message.rfind("bad.toml: ", 0), 0) << message;
  EXPECT_NE(message.find(GetParam().fragment), std::string::npos) << message;
}

INSTANTIATE_TEST_SUITE_P(
    AppManifestTest, BadManifestTest,
    ::testing::Values(
        BadManifest{.text = "[app", .fragment = "failed to parse"},
        BadManifest{.text = "", .fragment = "missing [app] section"},
        BadManifest{
            .text = "[app]\nname = \"x\"\n",
            .fragment = "missing required field 'app.id'"},
        BadManifest{
            .text = "[app]\nid = \"x\"\n[[activity]]\nlabel = \"L\"\n",
            .fragment = "activity #0: missing required field 'class'"},
        BadManifest{
            .text = "[app]\nid = \"x\"\n[[activity]]\nclass = \"A\"\n"
                    "[[activity.intent_filter]]\ncategory = \"default\"\n",
            .fragment = "intent_filter #0: missing required field 'action'"},
        BadManifest{
            .text = "[app]\nid = \"x\"\nactivity = 3\n",
            .fragment = "'activity' must be an array of tables"}));

// =============================================================================
// AppManager
// =============================================================================

class AppManagerTest : public TempDirFixture {
 protected:
  void SetUp() override {
    TempDirFixture::SetUp();
    classes_.Register<Activity>("ShareActivity");
    classes_.Register<Activity>("EmailActivity");
    classes_.Register<Activity>("HomeActivity");
  }

  auto App(const std::string& id, const std::string& class_name,
           const std::string& action, bool exported = true) -> AppManifest {
    AppManifest app{.id = id, .name = id};
    app.activities.push_back(
        ActivityEntry{
            .class_name = class_name,
            .label = class_name,
            .exported = exported,
            .filters = {{.action = action, .category = "default"}},
        });
    return app;
  }

  void WriteManifest(
      const std::string& dir, const std::string& id,
      const std::string& class_name, const std::string& action) {
    WriteFile(
        "apps/" + dir + "/manifest.toml",
        "[app]\nid = \"" + id + "\"\n\n[[activity]]\nclass = \"" + class_name +
            "\"\n\n[[activity.intent_filter]]\naction = \"" + action +
            "\"\ncategory = \"default\"\n");
  }

  Logger logger_{
      LogLevel::kTrace, std::make_shared<spdlog::sinks::null_sink_mt>()};
  ActivityRegistry registry_;
  ActivityClassTable classes_;
  AppManager apps_{registry_, classes_, logger_};
};

TEST_F(AppManagerTest, BuiltinRegistersExportedFilters) {
  EXPECT_TRUE(apps_.RegisterBuiltin(App("share", "ShareActivity", "SEND")));
  EXPECT_TRUE(apps_.RegisterBuiltin(App("email", "EmailActivity", "SEND")));

  EXPECT_EQ(
      ClassNames(registry_.Resolve(Intent::Implicit("SEND"))),
      (std::vector<std::string>{"ShareActivity", "EmailActivity"}));
  ASSERT_NE(apps_.FindApp("email"), nullptr);
  EXPECT_EQ(apps_.FindApp("missing"), nullptr);
}

TEST_F(AppManagerTest, PrivateActivityIsNotResolvable) {
  EXPECT_TRUE(apps_.RegisterBuiltin(
      App("share", "ShareActivity", "SEND", /*exported=*/false)));

  EXPECT_TRUE(registry_.Resolve(Intent::Implicit("SEND")).empty());
  EXPECT_TRUE(apps_.FindClass("ShareActivity").has_value());
}

TEST_F(AppManagerTest, DuplicateIdIsIgnoredWithWarning) {
  EXPECT_TRUE(apps_.RegisterBuiltin(App("share", "ShareActivity", "SEND")));
  EXPECT_FALSE(apps_.RegisterBuiltin(App("share", "EmailActivity", "SEND")));

  EXPECT_EQ(apps_.Apps().size(), 1);
  EXPECT_EQ(registry_.Candidates("SEND").size(), 1);
  EXPECT_EQ(apps_.Diagnostics().Count(DiagCode::kManifest), 1);
  EXPECT_FALSE(apps_.Diagnostics().HasErrors());
}

TEST_F(AppManagerTest, UnknownClassIsSkippedWithWarning) {
  EXPECT_TRUE(apps_.RegisterBuiltin(App("ghost", "GhostActivity", "VIEW")));

  EXPECT_TRUE(registry_.Candidates("VIEW").empty());
  ASSERT_NE(apps_.FindApp("ghost"), nullptr);
  EXPECT_TRUE(apps_.FindApp("ghost")->activities.empty());
  EXPECT_EQ(apps_.Diagnostics().Count(DiagCode::kUnknownActivityClass), 1);
}

TEST_F(AppManagerTest, FallbackMakesAnyClassKnown) {
  classes_.SetFallback([](const std::string&) -> std::unique_ptr<Activity> {
    return std::make_unique<Activity>();
  });

  EXPECT_TRUE(apps_.RegisterBuiltin(App("ghost", "GhostActivity", "VIEW")));

  EXPECT_EQ(
      ClassNames(registry_.Candidates("VIEW")),
      (std::vector<std::string>{"GhostActivity"}));
  EXPECT_EQ(apps_.Diagnostics().Count(DiagCode::kUnknownActivityClass), 0);
}

TEST_F(AppManagerTest, LauncherEntriesMatchActionAndCategory) {
  AppManifest home = App("home", "HomeActivity", "main");
  home.activities[0].filters[0].category = "launcher";
  apps_.RegisterBuiltin(std::move(home));
  apps_.RegisterBuiltin(App("share", "ShareActivity", "main"));

  auto launchers = apps_.LauncherEntries("main", "launcher");
  ASSERT_EQ(launchers.size(), 1);
  EXPECT_EQ(launchers[0].app_id, "home");
  EXPECT_EQ(launchers[0].class_name, "HomeActivity");

  EXPECT_EQ(apps_.LauncherEntries("main", "").size(), 2);
  EXPECT_TRUE(apps_.LauncherEntries("VIEW", "").empty());
}

TEST_F(AppManagerTest, DiscoverInstallsInDirectoryOrder) {
  WriteManifest("b_email", "email", "EmailActivity", "SEND");
  WriteManifest("a_share", "share", "ShareActivity", "SEND");
  WriteFile("apps/notes/readme.txt", "not an app");

  auto installed = apps_.Discover(Dir() / "apps");

  ASSERT_TRUE(installed.has_value());
  EXPECT_EQ(*installed, 2);
  EXPECT_EQ(
      ClassNames(registry_.Candidates("SEND")),
      (std::vector<std::string>{"ShareActivity", "EmailActivity"}));
  EXPECT_EQ(apps_.FindApp("share")->root_dir, Dir() / "apps" / "a_share");
}

TEST_F(AppManagerTest, DiscoverSkipsBrokenManifest) {
  WriteManifest("good", "share", "ShareActivity", "SEND");
  WriteFile("apps/broken/manifest.toml", "[app]\nname = \"no id\"\n");

  auto installed = apps_.Discover(Dir() / "apps");

  ASSERT_TRUE(installed.has_value());
  EXPECT_EQ(*installed, 1);
  EXPECT_EQ(apps_.Diagnostics().Count(DiagCode::kManifest), 1);
  EXPECT_TRUE(apps_.Diagnostics().HasErrors());
}

TEST_F(AppManagerTest, DiscoverMissingDirectoryFails) {
  auto installed = apps_.Discover(Dir() / "nope");

  ASSERT_FALSE(installed.has_value());
  EXPECT_EQ(installed.error().Code(), DiagCode::kManifest);
  EXPECT_NE(
      installed.error().primary.message.find("apps directory not found"),
      std::string::npos);
}

}  // namespace
}  // namespace mpos::test
