#pragma once
#include <chrono>
#include <string>

namespace zit::timeutil {

// "2024-05-01T12:34:56.789Z"
auto iso8601_utc(std::chrono::system_clock::time_point when) -> std::string;

inline auto iso8601_utc_now() -> std::string {
  return iso8601_utc(std::chrono::system_clock::now());
}

} // namespace zit::timeutil
