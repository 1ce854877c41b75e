#pragma once
#include "zit/commit.hpp"
#include "zit/commit_diff.hpp"
#include "zit/config.hpp"
#include "zit/consts.hpp"
#include "zit/history.hpp"
#include "zit/object_store.hpp"
#include "zit/storage.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace zit {

class Repository {
public:
  using TraceFn = std::function<void(std::string_view)>;

  // On-disk repository at <root>/.zit
  explicit Repository(std::filesystem::path root);

  // Repository state kept in `storage`; working files still resolve against `root`.
  Repository(std::filesystem::path root, std::unique_ptr<Storage> storage);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto repo_dir() const -> std::filesystem::path { return root_ / consts::kRepoDir; }

  [[nodiscard]] Storage &storage() const { return *storage_; }
  [[nodiscard]] ObjectStore objects() const { return ObjectStore{*storage_}; }

  // Create objects/, an empty HEAD and an empty index.
  // Throws AlreadyInitialized (touching nothing) if HEAD already exists.
  void init();

  [[nodiscard]] auto is_initialized() const -> bool;

  // Snapshot a working file into the object store and stage it. Returns the blob id.
  // Throws MissingWorkingFile if the file cannot be read.
  std::string add(const std::filesystem::path &path);

  // Record the index as a new commit on top of HEAD. Returns the commit id.
  std::string commit(std::string_view message);

  [[nodiscard]] std::optional<std::string> head() const;

  [[nodiscard]] CommitRecord read_commit(std::string_view commit_hex) const;

  // Newest-first history from HEAD.
  [[nodiscard]] CommitWalk log() const;

  [[nodiscard]] CommitDiff diff(std::string_view commit_hex) const;

  // Full digest for a 40-hex id or a unique prefix of a commit reachable from HEAD.
  [[nodiscard]] std::string resolve(std::string_view rev) const;

  [[nodiscard]] Settings settings() const;

  // Receives one line per storage mutation; empty function disables tracing.
  void set_trace(TraceFn fn) { trace_ = std::move(fn); }

private:
  void require_initialized(std::string_view op) const;
  void trace(const std::string &event) const;

  std::filesystem::path root_;
  std::unique_ptr<Storage> storage_;
  TraceFn trace_;
};

} // namespace zit
