#include "zit/commit_diff.hpp"

#include "zit/errors.hpp"
#include "zit/object_store.hpp"

#include <algorithm>

namespace zit {

namespace {

std::vector<std::string> blob_lines(const ObjectStore &store, const std::string &hex) {
  return diff::split_lines(store.get(hex));
}

} // namespace

CommitDiff diff_commit(const ObjectStore &store, std::string_view commit_hex) {
  if (!store.contains(commit_hex)) {
    throw NotFound("commit not found: " + std::string(commit_hex));
  }
  CommitDiff out{.digest = std::string(commit_hex),
                 .commit = parse_commit(store.get(commit_hex)),
                 .files = {}};

  // The parent is read once; if that fails, every file carries the error.
  std::optional<CommitRecord> parent;
  std::optional<std::string> parent_error;
  if (out.commit.parent) {
    try {
      parent = parse_commit(store.get(*out.commit.parent));
    } catch (const NotFound &) {
      parent_error = "parent commit not found: " + *out.commit.parent;
    } catch (const CorruptState &e) {
      parent_error = e.what();
    }
  }

  out.files.reserve(out.commit.files.size());
  for (const auto &entry : out.commit.files) {
    FileDiff fd{.path = entry.path};
    try {
      const auto new_lines = blob_lines(store, entry.hash);
      if (parent_error) {
        fd.error = *parent_error;
      } else if (!parent) {
        fd.hunks = diff::all_added(new_lines);
      } else {
        const auto it = std::ranges::find_if(
            parent->files, [&](const StagingEntry &e) { return e.path == entry.path; });
        if (it == parent->files.end()) {
          fd.hunks = diff::all_added(new_lines);
        } else {
          fd.status = FileStatus::Modified;
          fd.hunks = diff::diff_lines(blob_lines(store, it->hash), new_lines);
        }
      }
    } catch (const NotFound &e) {
      fd.error = e.what();
    }
    out.files.push_back(std::move(fd));
  }
  return out;
}

} // namespace zit
