#include "zit/object_store.hpp"

#include "zit/consts.hpp"
#include "zit/errors.hpp"
#include "zit/hash.hpp"
#include "zit/storage.hpp"

#include <algorithm>
#include <cctype>

namespace zit {

std::string ObjectStore::key_for(std::string_view hex_oid) {
  std::string key(consts::kObjectsDir);
  key.push_back('/');
  for (const char c : hex_oid) {
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return key;
}

std::string ObjectStore::put(std::string_view content) const {
  std::string hex = compute_digest(content);
  const auto key = key_for(hex);
  // Another writer may store the same object first; create() then leaves it be.
  if (!storage_.exists(key)) {
    (void)storage_.create(key, content);
  }
  return hex;
}

std::string ObjectStore::get(std::string_view hex_oid) const {
  if (!looks_hex40(hex_oid)) {
    throw NotFound("object not found: bad oid '" + std::string(hex_oid) + "'");
  }
  auto data = storage_.read(key_for(hex_oid));
  if (!data) {
    throw NotFound("object not found: " + std::string(hex_oid));
  }
  return std::move(*data);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  return looks_hex40(hex_oid) && storage_.exists(key_for(hex_oid));
}

std::vector<std::string> ObjectStore::list() const {
  auto names = storage_.list(consts::kObjectsDir);
  std::erase_if(names, [](const std::string &n) { return !looks_hex40(n); });
  return names;
}

} // namespace zit
