#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>

#include "floodgate/timedef.hpp"

namespace floodgate {

namespace detail {

constexpr auto Write2(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto Write4(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto Copy3(auto des, const char* src) {
  *des = src[0];
  *++des = src[1];
  *++des = src[2];
  return ++des;
}

inline constexpr const char* const kWeekDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
inline constexpr const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

}  // namespace detail

inline constexpr std::size_t kRFC7231DateStrLen = 29;
inline constexpr std::size_t kCommonLogDateStrLen = 26;

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least kRFC7231DateStrLen characters (no null terminator added).
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  out = detail::Copy3(out, detail::kWeekDays[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = detail::Write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = detail::Copy3(++out, detail::kMonths[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = detail::Write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = detail::Write2(++out, hms.hours().count());
  *out = ':';
  out = detail::Write2(++out, hms.minutes().count());
  *out = ':';
  out = detail::Write2(++out, hms.seconds().count());
  *out = ' ';
  return detail::Copy3(++out, "GMT");
}

/// Format a time point the way the Common Log Format expects it, always in UTC:
///   '10/Oct/2000:13:55:36 +0000'
/// Buffer must have space for at least kCommonLogDateStrLen characters (no null terminator added).
constexpr auto TimeToStringCommonLog(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  out = detail::Write2(out, static_cast<unsigned>(ymd.day()));
  *out = '/';
  out = detail::Copy3(++out, detail::kMonths[static_cast<unsigned>(ymd.month()) - 1]);
  *out = '/';
  out = detail::Write4(++out, static_cast<int>(ymd.year()));
  *out = ':';
  out = detail::Write2(++out, hms.hours().count());
  *out = ':';
  out = detail::Write2(++out, hms.minutes().count());
  *out = ':';
  out = detail::Write2(++out, hms.seconds().count());
  *out = ' ';
  *++out = '+';
  out = detail::Write4(++out, 0);
  return out;
}

}  // namespace floodgate
