#include "cli/session.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string_view>

namespace zit::cli {

Repository open_repository() {
  Repository repo{std::filesystem::current_path()};
  if (const char *flag = std::getenv("ZIT_TRACE"); flag && std::string_view(flag) == "1") {
    repo.set_trace([](std::string_view event) { std::cerr << "trace: " << event << "\n"; });
  }
  return repo;
}

} // namespace zit::cli
