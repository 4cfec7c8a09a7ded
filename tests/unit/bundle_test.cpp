#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "mpos/intent/bundle.hpp"

namespace mpos::test {
namespace {

TEST(BundleTest, FormatScalars) {
  EXPECT_EQ(FormatValue(Value{}), "null");
  EXPECT_EQ(FormatValue(true), "true");
  EXPECT_EQ(FormatValue(int64_t{-7}), "-7");
  EXPECT_EQ(FormatValue(1.5), "1.5");
  EXPECT_EQ(FormatValue(std::string("a b")), "\"a b\"");
}

TEST(BundleTest, FormatList) {
  EXPECT_EQ(
      FormatValue(std::vector<std::string>{"x", "y"}), "[x, y]");
  EXPECT_EQ(FormatValue(std::vector<std::string>{}), "[]");
}

TEST(BundleTest, FormatBundleSortsKeys) {
  Bundle bundle{{"name", std::string("a.png")}, {"count", int64_t{2}}};

  EXPECT_EQ(FormatBundle(bundle), "{count=2, name=\"a.png\"}");
  EXPECT_EQ(FormatBundle(Bundle{}), "{}");
}

TEST(BundleTest, Truthiness) {
  EXPECT_FALSE(IsTruthy(Value{}));
  EXPECT_FALSE(IsTruthy(false));
  EXPECT_FALSE(IsTruthy(int64_t{0}));
  EXPECT_FALSE(IsTruthy(0.0));
  EXPECT_FALSE(IsTruthy(std::string()));
  EXPECT_FALSE(IsTruthy(std::vector<std::string>{}));

  EXPECT_TRUE(IsTruthy(true));
  EXPECT_TRUE(IsTruthy(int64_t{-1}));
  EXPECT_TRUE(IsTruthy(0.25));
  EXPECT_TRUE(IsTruthy(std::string("false")));
  EXPECT_TRUE(IsTruthy(std::vector<std::string>{""}));
}

}  // namespace
}  // namespace mpos::test
