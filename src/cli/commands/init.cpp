#include "cli/session.hpp"
#include "zit/errors.hpp"

#include <iostream>

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    auto repo = zit::cli::open_repository();
    repo.init();
    std::cout << "Initialized empty zit repository in " << repo.repo_dir().string() << "\n";
    return 0;
  } catch (const zit::AlreadyInitialized &e) {
    // reported, not fatal: nothing was touched
    std::cout << e.what() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
