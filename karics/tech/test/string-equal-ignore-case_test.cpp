#include "karics/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace karics {

TEST(CaseInsensitiveEqual, Basic) {
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Length", "content-length"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("Content-Length", "Content-Type"));
  EXPECT_FALSE(CaseInsensitiveEqual("abc", "abcd"));
}

TEST(ContainsTokenIgnoreCase, FindsTokenInList) {
  EXPECT_TRUE(ContainsTokenIgnoreCase("close", "close"));
  EXPECT_TRUE(ContainsTokenIgnoreCase("keep-alive, Upgrade", "upgrade"));
  EXPECT_TRUE(ContainsTokenIgnoreCase("  Keep-Alive\t", "keep-alive"));
  EXPECT_TRUE(ContainsTokenIgnoreCase("gzip,chunked", "chunked"));
}

TEST(ContainsTokenIgnoreCase, NoPartialMatch) {
  EXPECT_FALSE(ContainsTokenIgnoreCase("closed", "close"));
  EXPECT_FALSE(ContainsTokenIgnoreCase("", "close"));
  EXPECT_FALSE(ContainsTokenIgnoreCase("keep-alive", "close"));
}

static_assert(CaseInsensitiveEqual("HOST", "host"));

}  // namespace karics
