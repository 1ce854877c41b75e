#include "cli/session.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: zit add <file> [<file> ...]\n";
    return 2;
  }

  auto repo = zit::cli::open_repository();
  if (!repo.is_initialized()) {
    std::cerr << "add: not a zit repo (run `zit init`)\n";
    return 1;
  }

  // Collect unique paths while preserving order
  std::vector<fs::path> paths;
  paths.reserve(static_cast<std::size_t>(argc) - 1);
  for (int i = 1; i < argc; ++i) {
    fs::path path = argv[i];
    if (std::ranges::find(paths, path) == paths.end()) {
      paths.push_back(std::move(path));
    }
  }

  int rc = 0;
  for (const auto &path : paths) {
    try {
      repo.add(path);
      std::cout << "Added " << path.generic_string() << "\n";
    } catch (const std::exception &e) {
      std::cerr << "add: " << e.what() << "\n";
      rc = 1;
    }
  }
  return rc;
}
