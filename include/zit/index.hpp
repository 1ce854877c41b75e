#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace zit {

class Storage;

struct StagingEntry {
  std::string path;  // as given to add, '/' separated
  std::string hash;  // 40-hex blob id

  bool operator==(const StagingEntry &) const = default;
};

// JSON array of {"path", "hash"} objects, as stored in .zit/index and in commit records.
nlohmann::ordered_json entries_to_json(const std::vector<StagingEntry> &entries);

// Inverse of entries_to_json; throws CorruptState naming `what` on a shape mismatch.
std::vector<StagingEntry> entries_from_json(const nlohmann::json &j, std::string_view what);

class Index {
public:
  explicit Index(Storage &storage) : storage_(storage) {}

  // Parse the index if it exists (empty if missing); throws CorruptState on bad content.
  void load();

  // Overwrite the index with current entries
  void save() const;

  // Replace the hash of an existing path in place, else append.
  void stage(std::string_view path, std::string_view hash);

  // stage() + save()
  void add_path(std::string_view path, std::string_view hash);

  // Drop every entry and persist "[]".
  void clear();

  [[nodiscard]] const std::vector<StagingEntry> &entries() const { return entries_; }

private:
  Storage &storage_;
  std::vector<StagingEntry> entries_;
};

} // namespace zit
