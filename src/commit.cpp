#include "zit/commit.hpp"

#include "zit/consts.hpp"
#include "zit/errors.hpp"
#include "zit/hash.hpp"

#include <nlohmann/json.hpp>

namespace zit {

std::string serialize_commit(const CommitRecord &record) {
  nlohmann::ordered_json j;
  j[std::string(consts::kKeyTimeStamp)] = record.timestamp;
  j[std::string(consts::kKeyMessage)] = record.message;
  j[std::string(consts::kKeyFiles)] = entries_to_json(record.files);
  if (record.parent) {
    j[std::string(consts::kKeyParent)] = *record.parent;
  } else {
    j[std::string(consts::kKeyParent)] = nullptr;
  }
  return j.dump(consts::kJsonIndent);
}

CommitRecord parse_commit(std::string_view text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw CorruptState(std::string("commit: ") + e.what());
  }
  if (!j.is_object()) {
    throw CorruptState("commit: expected an object");
  }

  const auto string_field = [&](std::string_view key) -> std::string {
    const auto it = j.find(std::string(key));
    if (it == j.end() || !it->is_string()) {
      throw CorruptState("commit: missing string field '" + std::string(key) + "'");
    }
    return it->get<std::string>();
  };

  CommitRecord rec{};
  rec.timestamp = string_field(consts::kKeyTimeStamp);
  rec.message = string_field(consts::kKeyMessage);

  const auto files = j.find(std::string(consts::kKeyFiles));
  if (files == j.end()) {
    throw CorruptState("commit: missing field 'files'");
  }
  rec.files = entries_from_json(*files, "commit files");

  const auto parent = j.find(std::string(consts::kKeyParent));
  if (parent == j.end()) {
    throw CorruptState("commit: missing field 'parent'");
  }
  if (!parent->is_null()) {
    if (!parent->is_string() || !looks_hex40(parent->get_ref<const std::string &>())) {
      throw CorruptState("commit: parent is neither null nor a commit id");
    }
    rec.parent = parent->get<std::string>();
  }
  return rec;
}

} // namespace zit
