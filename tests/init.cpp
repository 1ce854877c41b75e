#include "zit/errors.hpp"
#include "zit/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  // Make a unique temp repo root
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path repo_root = base / ("zit_init_test_" + suffix);

  try {
    fs::create_directories(repo_root);

    zit::Repository repo{repo_root};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }

    repo.init();

    // Check directory layout
    const fs::path zitdir = repo_root / ".zit";
    const fs::path head = zitdir / "HEAD";
    const fs::path index = zitdir / "index";
    const fs::path objects = zitdir / "objects";

    if (!fs::exists(objects) || !fs::is_directory(objects)) {
      std::cerr << "objects/ missing\n";
      return 1;
    }
    if (!fs::exists(head) || !slurp(head).empty()) {
      std::cerr << "HEAD missing or not empty\n";
      return 1;
    }
    if (slurp(index) != "[]") {
      std::cerr << "index content mismatch: [" << slurp(index) << "]\n";
      return 1;
    }
    if (!repo.is_initialized() || repo.head().has_value()) {
      std::cerr << "fresh repo should be initialized with no head\n";
      return 1;
    }

    // Stage something so a second init would visibly clobber the index.
    {
      std::ofstream(repo_root / "a.txt", std::ios::binary) << "hello\n";
    }
    repo.add("a.txt");
    const std::string staged_index = slurp(index);

    // Calling init again reports already-initialized and touches nothing
    bool threw = false;
    try {
      repo.init();
    } catch (const zit::AlreadyInitialized &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "init did not report an already-initialized repo\n";
      return 1;
    }
    if (slurp(index) != staged_index || !slurp(head).empty()) {
      std::cerr << "second init modified repository state\n";
      return 1;
    }

    // Operations other than init need a repository
    zit::Repository empty{repo_root / "elsewhere"};
    threw = false;
    try {
      empty.commit("nothing");
    } catch (const zit::NotARepository &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "commit outside a repository did not fail\n";
      return 1;
    }

    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(repo_root);
    return 1;
  }

  // Clean up
  std::error_code ec;
  fs::remove_all(repo_root, ec);
  return 0;
}
