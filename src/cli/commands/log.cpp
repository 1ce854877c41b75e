#include "cli/session.hpp"

#include <iostream>
#include <string>

int cmd_log(int /*argc*/, char ** /*argv*/) {
  auto repo = zit::cli::open_repository();
  if (!repo.is_initialized()) {
    std::cerr << "log: not a zit repo (run `zit init`)\n";
    return 1;
  }
  try {
    const auto abbrev = repo.settings().abbrev;
    auto walk = repo.log();
    for (const auto &entry : walk) {
      std::cout << "------------------------------------------------------------------\n";
      std::cout << "Commit: " << entry.digest.substr(0, abbrev) << "\n";
      std::cout << "Date: " << entry.timestamp << "\n";
      std::cout << "\n" << entry.message << "\n\n";
    }
    if (const auto &why = walk.stop_reason()) {
      std::cerr << "log: history cut short: " << *why << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "log: " << e.what() << "\n";
    return 1;
  }
}
