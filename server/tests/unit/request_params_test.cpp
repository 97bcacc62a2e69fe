#include <gtest/gtest.h>

#include "extauth/request_params.hpp"

TEST(RequestParamsTest, ParsesQueryFromTarget) {
  auto params = extauth::ParseTargetQuery("/?action=requestToken&authUser=alice&sessionID=sess1");
  ASSERT_EQ(params.size(), 3u);
  EXPECT_EQ(params["action"], "requestToken");
  EXPECT_EQ(params["authUser"], "alice");
  EXPECT_EQ(params["sessionID"], "sess1");
}

TEST(RequestParamsTest, NoQueryYieldsEmpty) {
  EXPECT_TRUE(extauth::ParseTargetQuery("/").empty());
  EXPECT_TRUE(extauth::ParseTargetQuery("/?").empty());
}

TEST(RequestParamsTest, DecodesPercentAndPlus) {
  auto params = extauth::ParseFormEncoded("a=hello+world&b=%41%2d%5F&c=100%");
  EXPECT_EQ(params["a"], "hello world");
  EXPECT_EQ(params["b"], "A-_");
  EXPECT_EQ(params["c"], "100%");
}

TEST(RequestParamsTest, DropsBlankValuesAndKeepsLastDuplicate) {
  auto params = extauth::ParseFormEncoded("sessionId=&token=one&token=two&flag&=x");
  EXPECT_EQ(params.count("sessionId"), 0u);
  EXPECT_EQ(params.count("flag"), 0u);
  ASSERT_EQ(params.size(), 2u);
  EXPECT_EQ(params["token"], "two");
  EXPECT_EQ(params[""], "x");
}
