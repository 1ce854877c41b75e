#include "zit/index.hpp"

#include "zit/consts.hpp"
#include "zit/errors.hpp"
#include "zit/hash.hpp"
#include "zit/storage.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

namespace zit {

nlohmann::ordered_json entries_to_json(const std::vector<StagingEntry> &entries) {
  auto arr = nlohmann::ordered_json::array();
  for (const auto &e : entries) {
    nlohmann::ordered_json obj;
    obj[std::string(consts::kKeyPath)] = e.path;
    obj[std::string(consts::kKeyHash)] = e.hash;
    arr.push_back(std::move(obj));
  }
  return arr;
}

std::vector<StagingEntry> entries_from_json(const nlohmann::json &j, std::string_view what) {
  const auto fail = [&](const std::string &why) -> CorruptState {
    return CorruptState(std::string(what) + ": " + why);
  };
  if (!j.is_array()) {
    throw fail("expected an array of entries");
  }
  std::vector<StagingEntry> out;
  out.reserve(j.size());
  std::set<std::string> paths;
  for (const auto &item : j) {
    if (!item.is_object()) {
      throw fail("entry is not an object");
    }
    const auto path = item.find(std::string(consts::kKeyPath));
    const auto hash = item.find(std::string(consts::kKeyHash));
    if (path == item.end() || !path->is_string() || path->get_ref<const std::string &>().empty()) {
      throw fail("entry without a path");
    }
    if (hash == item.end() || !hash->is_string() ||
        !looks_hex40(hash->get_ref<const std::string &>())) {
      throw fail("entry without a valid hash");
    }
    StagingEntry e{.path = path->get<std::string>(), .hash = hash->get<std::string>()};
    if (!paths.insert(e.path).second) {
      throw fail("duplicate path " + e.path);
    }
    out.push_back(std::move(e));
  }
  return out;
}

void Index::load() {
  entries_.clear();
  const auto text = storage_.read(consts::kIndexFile);
  if (!text) {
    return;
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(*text);
  } catch (const nlohmann::json::parse_error &e) {
    throw CorruptState(std::string("index: ") + e.what());
  }
  entries_ = entries_from_json(j, "index");
}

void Index::save() const {
  storage_.write(consts::kIndexFile, entries_to_json(entries_).dump(consts::kJsonIndent));
}

void Index::stage(std::string_view path, std::string_view hash) {
  auto it = std::ranges::find_if(entries_, [&](const StagingEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->hash = std::string(hash);
  } else {
    entries_.push_back(StagingEntry{.path = std::string(path), .hash = std::string(hash)});
  }
}

void Index::add_path(std::string_view path, std::string_view hash) {
  stage(path, hash);
  save();
}

void Index::clear() {
  entries_.clear();
  save();
}

} // namespace zit
