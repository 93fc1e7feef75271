#include "karics/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string_view>

#include "karics/timedef.hpp"

namespace karics {

namespace {

std::string_view Format(SysTimePoint tp, char (&buf)[kRFC7231DateStrLen]) {
  const char* end = TimeToStringRFC7231(tp, buf);
  return {buf, static_cast<std::size_t>(end - buf)};
}

}  // namespace

TEST(TimeToStringRFC7231, Rfc7231Example) {
  using namespace std::chrono;
  // Sun, 06 Nov 1994 08:49:37 GMT
  const SysTimePoint tp = sys_days{year{1994} / November / 6} + hours{8} + minutes{49} + seconds{37};
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(Format(tp, buf), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeToStringRFC7231, Epoch) {
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(Format(SysTimePoint{}, buf), "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(TimeToStringRFC7231, SubSecondsAreTruncated) {
  using namespace std::chrono;
  const SysTimePoint tp = sys_days{year{2024} / February / 29} + hours{23} + minutes{59} + seconds{59} +
                          milliseconds{999};
  char buf[kRFC7231DateStrLen];
  EXPECT_EQ(Format(tp, buf), "Thu, 29 Feb 2024 23:59:59 GMT");
}

}  // namespace karics
