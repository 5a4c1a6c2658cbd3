#include <gtest/gtest.h>

#include "../src/runbox/http_utils.h"

using http_utils::Split;

TEST(SplitUrl, OriginAndPath) {
  auto res = Split("https://host.example:8443/a/b?c=1");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->origin, "https://host.example:8443");
  EXPECT_EQ(res->path, "/a/b?c=1");
}

TEST(SplitUrl, DefaultPath) {
  auto res = Split("http://host.example");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->origin, "http://host.example");
  EXPECT_EQ(res->path, "/");
  res = Split("http://host.example?x=1");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->path, "/?x=1");
}

TEST(SplitUrl, DropsFragment) {
  auto res = Split("https://host.example/code.py#main");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->path, "/code.py");
  res = Split("https://host.example#main");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->path, "/");
}

TEST(SplitUrl, Rejects) {
  EXPECT_FALSE(Split(""));
  EXPECT_FALSE(Split("host.example/a"));
  EXPECT_FALSE(Split("://host.example/a"));
  EXPECT_FALSE(Split("ftp://host.example/a"));
  EXPECT_FALSE(Split("file:///etc/passwd"));
  EXPECT_FALSE(Split("https:///a"));
}

TEST(HttpUtils, IsSuccess) {
  EXPECT_TRUE(http_utils::IsSuccess(200));
  EXPECT_TRUE(http_utils::IsSuccess(204));
  EXPECT_TRUE(http_utils::IsSuccess(299));
  EXPECT_FALSE(http_utils::IsSuccess(300));
  EXPECT_FALSE(http_utils::IsSuccess(302));
  EXPECT_FALSE(http_utils::IsSuccess(404));
}

TEST(HttpUtils, HeadersLoggedByNameOnly) {
  std::string formatted = http_utils::FormatOneParam(httplib::Headers{{"Authorization", "Token very-secret"}});
  EXPECT_NE(formatted.find("Authorization"), std::string::npos);
  EXPECT_EQ(formatted.find("very-secret"), std::string::npos);
}
