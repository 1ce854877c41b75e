#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace zit {

class Storage;

// Content-addressed blobs and commit records under "objects/<hex>".
class ObjectStore {
public:
  explicit ObjectStore(Storage &storage) : storage_(storage) {}

  // Store `content` verbatim unless an object with its digest exists. Returns 40-hex id.
  std::string put(std::string_view content) const;

  // Stored bytes for `hex_oid`; throws NotFound if absent or malformed.
  [[nodiscard]] std::string get(std::string_view hex_oid) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  // Every stored digest, sorted.
  [[nodiscard]] std::vector<std::string> list() const;

  [[nodiscard]] static std::string key_for(std::string_view hex_oid);

private:
  Storage &storage_;
};

} // namespace zit
