#pragma once
#include "zit/index.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zit {

struct CommitRecord {
  std::string timestamp;              // ISO-8601, UTC
  std::string message;
  std::vector<StagingEntry> files;    // snapshot of the index at commit time
  std::optional<std::string> parent;  // std::nullopt for the root commit
};

// Bytes written under objects/<hex>; also the digest preimage.
std::string serialize_commit(const CommitRecord &record);

// Throws CorruptState if `text` is not a commit record.
CommitRecord parse_commit(std::string_view text);

} // namespace zit
