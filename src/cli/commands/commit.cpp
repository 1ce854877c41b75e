#include "cli/session.hpp"

#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: zit commit -m "msg"
  std::string message;
  bool have_message = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
      have_message = true;
    }
  }
  if (!have_message) {
    std::cerr << "usage: zit commit -m <message>\n";
    return 2;
  }

  auto repo = zit::cli::open_repository();
  if (!repo.is_initialized()) {
    std::cerr << "commit: not a zit repo (run `zit init`)\n";
    return 1;
  }

  try {
    const std::string oid = repo.commit(message);
    std::cout << "Commit successfully created: " << oid << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
