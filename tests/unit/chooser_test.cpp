#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mpos/activity/activity_result.hpp"
#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/intent/intent.hpp"
#include "mpos/navigator/chooser_activity.hpp"
#include "tests/unit/navigator_fixture.hpp"

namespace mpos::test {
namespace {

using Trace = std::vector<std::string>;

class ChooserTest : public NavigatorFixture {
 protected:
  void SetUp() override {
    registry_.Register("SEND", ScriptedClass("ShareActivity"));
    registry_.Register("SEND", ScriptedClass("EmailActivity"));
    Launch(home_);
  }

  auto Chooser() -> ChooserActivity* {
    return dynamic_cast<ChooserActivity*>(navigator_.Top());
  }

  ActivityClass home_ = ScriptedClass("Home");
};

TEST_F(ChooserTest, ChoosingLaunchesExplicitIntentWithOriginalPayload) {
  Intent send = Intent::Implicit("SEND");
  send.Put("text", "hello").AddFlag(std::string(kFlagNoAnimation));
  ASSERT_TRUE(navigator_.Top()->StartActivity(send).has_value());
  ClearTrace();

  ASSERT_NE(Chooser(), nullptr);
  EXPECT_TRUE(Chooser()->Choose(1));

  EXPECT_EQ(
      navigator_.StackClassNames(),
      (std::vector<std::string>{"Home", "EmailActivity"}));
  const Intent& delivered = navigator_.Top()->GetIntent();
  ASSERT_TRUE(delivered.IsExplicit());
  EXPECT_EQ(delivered.Target()->name, "EmailActivity");
  EXPECT_EQ(delivered.Action(), std::optional<std::string>("SEND"));
  ASSERT_NE(delivered.Get("text"), nullptr);
  EXPECT_EQ(std::get<std::string>(*delivered.Get("text")), "hello");
  EXPECT_TRUE(delivered.HasFlag(kFlagNoAnimation));
}

TEST_F(ChooserTest, ChooserLeavesWithoutResumingActivityBeneath) {
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Implicit("SEND")).has_value());
  ClearTrace();

  ASSERT_TRUE(Chooser()->Choose(0));

  EXPECT_EQ(
      HookTrace(),
      (Trace{"mpos.Chooser.onPause", "mpos.Chooser.onStop",
             "mpos.Chooser.onDestroy", "ShareActivity.onCreate",
             "ShareActivity.onStart", "ShareActivity.onResume"}));
}

TEST_F(ChooserTest, OutOfRangeChoiceIsIgnored) {
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Implicit("SEND")).has_value());
  ClearTrace();

  EXPECT_FALSE(Chooser()->Choose(2));

  EXPECT_TRUE(HookTrace().empty());
  EXPECT_NE(Chooser(), nullptr);
  EXPECT_EQ(navigator_.Diagnostics().Count(DiagCode::kInvalidChoice), 1);
}

TEST_F(ChooserTest, StaleChooserCannotChoose) {
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Implicit("SEND")).has_value());
  LaunchId chooser = Chooser()->GetLaunchId();
  ASSERT_TRUE(Chooser()->Choose(0));

  EXPECT_FALSE(navigator_.Choose(chooser, 0));
  EXPECT_EQ(navigator_.StackDepth(), 2);
}

TEST_F(ChooserTest, BackOutOfChooserResumesLauncher) {
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Implicit("SEND")).has_value());
  ClearTrace();

  EXPECT_TRUE(navigator_.Back());

  EXPECT_EQ(navigator_.StackClassNames(), (std::vector<std::string>{"Home"}));
  EXPECT_EQ(HookTrace().back(), "Home.onResume");
}

TEST_F(ChooserTest, ResultFollowsChoiceToChosenActivity) {
  std::optional<ActivityResult> received;
  ASSERT_TRUE(navigator_.Top()
                  ->StartActivityForResult(
                      Intent::Implicit("SEND"),
                      [&](const ActivityResult& r) { received = r; })
                  .has_value());

  ASSERT_TRUE(Chooser()->Choose(1));
  EXPECT_EQ(navigator_.Results().Pending(), 1);
  navigator_.Top()->Finish("SENT", {{"count", int64_t{2}}});

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->result_code, std::optional<std::string>("SENT"));
  EXPECT_EQ(received->data, (Bundle{{"count", int64_t{2}}}));
  EXPECT_EQ(navigator_.StackClassNames(), (std::vector<std::string>{"Home"}));
}

TEST_F(ChooserTest, CancelledChooserDropsResult) {
  int calls = 0;
  ASSERT_TRUE(navigator_.Top()
                  ->StartActivityForResult(
                      Intent::Implicit("SEND"),
                      [&](const ActivityResult&) { ++calls; })
                  .has_value());

  navigator_.Top()->Finish();

  EXPECT_EQ(calls, 0);
  EXPECT_EQ(navigator_.Results().Pending(), 0);
}

TEST_F(ChooserTest, ChooserTraceListsCandidatesInOrder) {
  ASSERT_TRUE(
      navigator_.Top()->StartActivity(Intent::Implicit("SEND")).has_value());

  std::vector<std::string> shown;
  for (const auto& event : navigator_.Trace().Events()) {
    if (const auto* chooser = std::get_if<trace::ChooserShown>(&event)) {
      shown = chooser->candidates;
    }
  }
  EXPECT_EQ(
      shown, (std::vector<std::string>{"ShareActivity", "EmailActivity"}));
}

}  // namespace
}  // namespace mpos::test
