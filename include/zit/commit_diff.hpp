#pragma once
#include "zit/commit.hpp"
#include "zit/diff.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zit {

class ObjectStore;

enum class FileStatus : std::uint8_t { Added, Modified };

struct FileDiff {
  std::string path;
  FileStatus status = FileStatus::Added;
  std::vector<diff::Hunk> hunks;     // unfiltered; see diff::visible_hunks
  std::optional<std::string> error;  // set when a blob or the parent could not be read
};

struct CommitDiff {
  std::string digest;
  CommitRecord commit;
  std::vector<FileDiff> files;  // commit.files order
};

// Diff every file recorded in `commit_hex` against the same path in its parent.
// Throws NotFound if the commit itself is missing, CorruptState if it is not a commit.
CommitDiff diff_commit(const ObjectStore &store, std::string_view commit_hex);

} // namespace zit
