#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "mpos/intent/intent.hpp"
#include "tests/unit/navigator_fixture.hpp"

namespace mpos::test {
namespace {

using Trace = std::vector<std::string>;

class IntentFlagsTest : public NavigatorFixture {
 protected:
  auto Flagged(const ActivityClass& activity_class, std::string_view flag)
      -> Intent {
    Intent intent = Intent::Explicit(activity_class);
    intent.AddFlag(std::string(flag));
    return intent;
  }

  ActivityClass home_ = ScriptedClass("Home");
  ActivityClass list_ = ScriptedClass("List");
  ActivityClass detail_ = ScriptedClass("Detail");
};

// =============================================================================
// clear_top
// =============================================================================

TEST_F(IntentFlagsTest, ClearTopRemovesExistingInstanceAndAbove) {
  ScriptedActivity* home = Launch(home_);
  ASSERT_TRUE(home->StartActivity(Intent::Explicit(list_)).has_value());
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Explicit(detail_)).has_value());
  ClearTrace();

  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Flagged(list_, kFlagClearTop)).has_value());

  EXPECT_EQ(
      navigator_.StackClassNames(),
      (std::vector<std::string>{"Home", "List"}));
  EXPECT_EQ(
      HookTrace(),
      (Trace{"Detail.onPause", "Detail.onStop", "Detail.onDestroy",
             "List.onDestroy", "List.onCreate", "List.onStart",
             "List.onResume"}));
}

TEST_F(IntentFlagsTest, ClearTopWithoutExistingInstanceIsPlainLaunch) {
  ScriptedActivity* home = Launch(home_);
  ClearTrace();

  ASSERT_TRUE(home->StartActivity(Flagged(list_, kFlagClearTop)).has_value());

  EXPECT_EQ(
      navigator_.StackClassNames(),
      (std::vector<std::string>{"Home", "List"}));
  EXPECT_EQ(
      HookTrace(), (Trace{"Home.onPause", "Home.onStop", "List.onCreate",
                          "List.onStart", "List.onResume"}));
}

TEST_F(IntentFlagsTest, FalseFlagValueIsIgnored) {
  ScriptedActivity* home = Launch(home_);
  ASSERT_TRUE(home->StartActivity(Intent::Explicit(list_)).has_value());

  Intent intent = Intent::Explicit(list_);
  intent.AddFlag(std::string(kFlagClearTop), false);
  ASSERT_TRUE(navigator_.Top()->StartActivity(intent).has_value());

  EXPECT_EQ(navigator_.StackDepth(), 3);
}

// =============================================================================
// no_history
// =============================================================================

TEST_F(IntentFlagsTest, NoHistoryEntryIsDestroyedWhenCovered) {
  ScriptedActivity* home = Launch(home_);
  ASSERT_TRUE(
      home->StartActivity(Flagged(list_, kFlagNoHistory)).has_value());
  ClearTrace();

  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Explicit(detail_)).has_value());

  EXPECT_EQ(
      navigator_.StackClassNames(),
      (std::vector<std::string>{"Home", "Detail"}));
  EXPECT_EQ(
      HookTrace(),
      (Trace{"List.onPause", "List.onStop", "List.onDestroy",
             "Detail.onCreate", "Detail.onStart", "Detail.onResume"}));

  navigator_.Top()->Finish();
  EXPECT_EQ(navigator_.Top(), home);
}

TEST_F(IntentFlagsTest, NoHistoryEntryStaysWhileOnTop) {
  ScriptedActivity* home = Launch(home_);
  ASSERT_TRUE(
      home->StartActivity(Flagged(list_, kFlagNoHistory)).has_value());

  navigator_.OnAppBackground();
  navigator_.OnAppForeground();

  EXPECT_EQ(
      navigator_.StackClassNames(),
      (std::vector<std::string>{"Home", "List"}));
}

// =============================================================================
// no_animation
// =============================================================================

TEST_F(IntentFlagsTest, NoAnimationReachesSurfaceHost) {
  RecordingSurfaceHost host;
  navigator_.SetSurfaceHost(&host);
  ScriptedActivity* home = Launch(home_);

  ASSERT_TRUE(
      home->StartActivity(Flagged(list_, kFlagNoAnimation)).has_value());

  EXPECT_EQ(
      host.calls,
      (std::vector<std::string>{"present:Home", "present-static:List"}));
  navigator_.Shutdown();
  navigator_.SetSurfaceHost(nullptr);
}

TEST_F(IntentFlagsTest, UnknownFlagsAreCarried) {
  Intent intent = Intent::Explicit(home_);
  intent.AddFlag("single_top");

  ASSERT_TRUE(navigator_.StartActivity(intent).has_value());

  EXPECT_TRUE(navigator_.Top()->GetIntent().HasFlag("single_top"));
}

}  // namespace
}  // namespace mpos::test
