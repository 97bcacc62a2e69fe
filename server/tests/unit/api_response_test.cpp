#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "extauth/api_response.hpp"

TEST(ApiResponseTest, JsonResponseShape) {
  auto res = extauth::MakeJsonResponse({{"sessionToken", "abc"}});
  EXPECT_EQ(res.status, 200u);
  EXPECT_EQ(res.content_type, "application/json");
  auto body = nlohmann::json::parse(res.body);
  EXPECT_EQ(body["sessionToken"], "abc");
}

TEST(ApiResponseTest, ErrorTextIsSingleLineWithStatusOk) {
  auto res = extauth::MakeErrorText("The action specified is not correct");
  EXPECT_EQ(res.status, 200u);
  EXPECT_EQ(res.body, "The action specified is not correct\n");
}

TEST(ApiResponseTest, AuthDocuments) {
  EXPECT_EQ(extauth::MakeAuthAccepted("alice").body, "<auth result=\"yes\"><username>alice</username></auth>");
  EXPECT_EQ(extauth::MakeAuthRejected("The session token is not valid").body,
            "<auth result=\"no\"><message>The session token is not valid</message></auth>");
  EXPECT_EQ(extauth::MakeAuthAccepted("alice").content_type, "text/xml");
}

TEST(ApiResponseTest, XmlPayloadIsEscaped) {
  EXPECT_EQ(extauth::XmlEscape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
  auto res = extauth::MakeAuthRejected("bad\n<param>");
  EXPECT_EQ(res.body, "<auth result=\"no\"><message>bad\n&lt;param&gt;</message></auth>");
}

TEST(ApiResponseTest, UnsupportedMethod) {
  auto res = extauth::MakeNotImplemented("PUT");
  EXPECT_EQ(res.status, 501u);
}
