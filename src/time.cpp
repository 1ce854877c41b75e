#include "zit/time.hpp"

#include <cstdio>
#include <ctime>

namespace zit::timeutil {

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch());
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms);
  auto millis = ms - secs;
  if (millis.count() < 0) { // pre-epoch: borrow a second
    secs -= std::chrono::seconds{1};
    millis += std::chrono::seconds{1};
  }
  const std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm gt{};
#if defined(_WIN32)
  gmtime_s(&gt, &t);
#else
  gmtime_r(&t, &gt);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", gt.tm_year + 1900,
                gt.tm_mon + 1, gt.tm_mday, gt.tm_hour, gt.tm_min, gt.tm_sec,
                static_cast<int>(millis.count()));
  return std::string(buf);
}

} // namespace zit::timeutil
