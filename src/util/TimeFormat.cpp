#include "util/TimeFormat.hpp"
#include <cstdio>
#include <ctime>

namespace netstatus::util {

std::string format_local(model::Clock::time_point tp) {
  auto t = model::Clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

} // namespace netstatus::util
