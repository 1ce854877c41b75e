#include "zit/commit.hpp"
#include "zit/commit_diff.hpp"
#include "zit/errors.hpp"
#include "zit/hash.hpp"
#include "zit/object_store.hpp"
#include "zit/repo.hpp"
#include "zit/storage.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using zit::diff::HunkKind;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::vector<std::string> lines_of(const zit::FileDiff &fd, HunkKind kind) {
  std::vector<std::string> out;
  for (const auto &h : zit::diff::visible_hunks(fd.hunks))
    if (h.kind == kind)
      out.insert(out.end(), h.lines.begin(), h.lines.end());
  return out;
}

static int on_disk() {
  const fs::path root =
      fs::temp_directory_path() / ("zit_diff_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  int rc = 0;
  try {
    zit::Repository repo{root};
    repo.init();

    write_file(root / "a.txt", "hello\n");
    write_file(root / "notes.txt", "one\n\n   \ntwo\n");
    repo.add("a.txt");
    repo.add("notes.txt");
    const auto first = repo.commit("first");

    write_file(root / "a.txt", "hello\nworld\n");
    write_file(root / "b.txt", "bee\n");
    repo.add("a.txt");
    repo.add("b.txt");
    const auto second = repo.commit("second");

    // Root commit: every non-blank line is added
    const auto d1 = repo.diff(first);
    if (d1.files.size() != 2 || d1.files[0].path != "a.txt" || d1.files[1].path != "notes.txt") {
      std::cerr << "root diff file list mismatch\n";
      return 1;
    }
    if (lines_of(d1.files[0], HunkKind::Added) != std::vector<std::string>{"hello"} ||
        lines_of(d1.files[1], HunkKind::Added) != std::vector<std::string>{"one", "two"} ||
        d1.files[1].status != zit::FileStatus::Added) {
      std::cerr << "root diff must report every non-blank line as added\n";
      return 1;
    }

    // Second commit against its parent
    const auto d2 = repo.diff(second);
    if (d2.files.size() != 2 || d2.commit.message != "second" || d2.digest != second) {
      std::cerr << "second diff header mismatch\n";
      return 1;
    }
    const auto &a = d2.files[0];
    if (a.path != "a.txt" || a.status != zit::FileStatus::Modified || a.error ||
        lines_of(a, HunkKind::Unchanged) != std::vector<std::string>{"hello"} ||
        lines_of(a, HunkKind::Added) != std::vector<std::string>{"world"} ||
        !lines_of(a, HunkKind::Removed).empty()) {
      std::cerr << "a.txt should show hello unchanged and world added\n";
      return 1;
    }
    const auto &b = d2.files[1];
    if (b.path != "b.txt" || b.status != zit::FileStatus::Added ||
        lines_of(b, HunkKind::Added) != std::vector<std::string>{"bee"}) {
      std::cerr << "b.txt should be new in the second commit\n";
      return 1;
    }

    bool threw = false;
    try {
      (void)repo.diff(zit::compute_digest("no such commit"));
    } catch (const zit::NotFound &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "diff of an unknown commit did not fail\n";
      rc = 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return rc;
}

static int missing_objects() {
  zit::MemoryStorage storage;
  const zit::ObjectStore store{storage};

  const auto present = store.put("kept\n");
  const auto absent = zit::compute_digest("never stored\n");

  // A missing blob only affects its own file
  const zit::CommitRecord root{.timestamp = "2024-01-01T00:00:00.000Z",
                               .message = "root",
                               .files = {{"gone.txt", absent}, {"kept.txt", present}},
                               .parent = std::nullopt};
  const auto root_hex = store.put(zit::serialize_commit(root));
  const auto d = zit::diff_commit(store, root_hex);
  if (d.files.size() != 2 || !d.files[0].error || d.files[1].error ||
      lines_of(d.files[1], HunkKind::Added) != std::vector<std::string>{"kept"}) {
    std::cerr << "missing blob must be reported per file\n";
    return 1;
  }

  // A missing parent is reported on each file, not thrown
  const zit::CommitRecord child{.timestamp = "2024-01-02T00:00:00.000Z",
                                .message = "child",
                                .files = {{"kept.txt", present}},
                                .parent = zit::compute_digest("lost parent")};
  const auto child_hex = store.put(zit::serialize_commit(child));
  const auto dc = zit::diff_commit(store, child_hex);
  if (dc.files.size() != 1 || !dc.files[0].error) {
    std::cerr << "missing parent must be reported per file\n";
    return 1;
  }

  // A blob is not a commit
  bool threw = false;
  try {
    (void)zit::diff_commit(store, present);
  } catch (const zit::CorruptState &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "diffing a blob did not report CorruptState\n";
    return 1;
  }
  return 0;
}

int main() {
  if (on_disk() != 0 || missing_objects() != 0) {
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
