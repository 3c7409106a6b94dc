#include "floodgate/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>

namespace floodgate {

namespace {
SysTimePoint MakeTimePoint(int year, unsigned month, unsigned day, int hours, int minutes, int seconds) {
  using namespace std::chrono;
  return sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}} + hours * 1h +
         minutes * 1min + seconds * 1s;
}
}  // namespace

TEST(TimeStringTest, RFC7231) {
  char buf[kRFC7231DateStrLen];
  const auto* end = TimeToStringRFC7231(MakeTimePoint(1994, 11, 6, 8, 49, 37), buf);
  EXPECT_EQ(std::string_view(buf, end), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeStringTest, RFC7231IgnoresSubSeconds) {
  char buf[kRFC7231DateStrLen];
  const auto* end =
      TimeToStringRFC7231(MakeTimePoint(2025, 1, 31, 23, 59, 59) + std::chrono::milliseconds{999}, buf);
  EXPECT_EQ(std::string_view(buf, end), "Fri, 31 Jan 2025 23:59:59 GMT");
}

TEST(TimeStringTest, CommonLog) {
  char buf[kCommonLogDateStrLen];
  const auto* end = TimeToStringCommonLog(MakeTimePoint(2000, 10, 10, 13, 55, 36), buf);
  EXPECT_EQ(std::string_view(buf, end), "10/Oct/2000:13:55:36 +0000");
  EXPECT_EQ(static_cast<std::size_t>(end - buf), kCommonLogDateStrLen);
}

TEST(TimeStringTest, CommonLogIntoString) {
  std::string out(kCommonLogDateStrLen, '\0');
  TimeToStringCommonLog(MakeTimePoint(2024, 2, 29, 0, 0, 1), out.data());
  EXPECT_EQ(out, "29/Feb/2024:00:00:01 +0000");
}

}  // namespace floodgate
