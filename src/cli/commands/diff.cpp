#include "cli/session.hpp"
#include "zit/diff.hpp"

#include <iostream>
#include <string>

namespace {

const char *status_name(zit::FileStatus status) {
  return status == zit::FileStatus::Modified ? "modified" : "added";
}

const char *hunk_prefix(zit::diff::HunkKind kind) {
  switch (kind) {
  case zit::diff::HunkKind::Added:
    return "+ ";
  case zit::diff::HunkKind::Removed:
    return "- ";
  case zit::diff::HunkKind::Unchanged:
    break;
  }
  return "  ";
}

} // namespace

int cmd_diff(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: zit diff <commit>\n";
    return 2;
  }

  auto repo = zit::cli::open_repository();
  if (!repo.is_initialized()) {
    std::cerr << "diff: not a zit repo (run `zit init`)\n";
    return 1;
  }

  try {
    const auto settings = repo.settings();
    const auto result = repo.diff(repo.resolve(argv[1]));
    std::cout << "Changes in commit " << result.digest << ":\n";
    for (const auto &file : result.files) {
      std::cout << "File: " << file.path << " (" << status_name(file.status) << ")\n";
      if (file.error) {
        std::cout << "  error: " << *file.error << "\n";
        continue;
      }
      const auto hunks =
          settings.show_blank_lines ? file.hunks : zit::diff::visible_hunks(file.hunks);
      for (const auto &hunk : hunks) {
        for (const auto &line : hunk.lines) {
          std::cout << hunk_prefix(hunk.kind) << line << "\n";
        }
      }
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "diff: " << e.what() << "\n";
    return 1;
  }
}
