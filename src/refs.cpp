#include "zit/refs.hpp"

#include "zit/consts.hpp"
#include "zit/errors.hpp"
#include "zit/hash.hpp"
#include "zit/storage.hpp"

#include <cctype>
#include <string>

namespace zit {

namespace {

std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.pop_back();
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  return s.substr(i);
}

// Removes HEAD.lock when the update is done, whatever the outcome.
class HeadLock {
public:
  explicit HeadLock(Storage &storage) : storage_(storage) {
    if (!storage_.create(consts::kHeadLock, "")) {
      throw LockHeld("unable to create '" + storage_.location(consts::kHeadLock) +
                     "': file exists. Another zit process seems to be committing in this "
                     "repository. If none is running, a previous commit was interrupted; "
                     "remove the file manually to continue.");
    }
  }
  ~HeadLock() {
    try {
      storage_.remove(consts::kHeadLock);
    } catch (const std::exception &) {
      // a stale lock is reported by the next writer
    }
  }
  HeadLock(const HeadLock &) = delete;
  HeadLock &operator=(const HeadLock &) = delete;

private:
  Storage &storage_;
};

} // namespace

std::optional<std::string> read_head(const Storage &storage) {
  auto text = storage.read(consts::kHeadFile);
  if (!text) {
    return std::nullopt;
  }
  std::string hex = trim(std::move(*text));
  if (hex.empty()) {
    return std::nullopt;
  }
  if (!looks_hex40(hex)) {
    throw CorruptState("HEAD: not a commit id: '" + hex + "'");
  }
  return hex;
}

void update_head(Storage &storage, const std::optional<std::string> &expected,
                 std::string_view next) {
  const HeadLock lock{storage};
  if (read_head(storage) != expected) {
    throw HeadMoved("HEAD moved from " + expected.value_or("(none)") +
                    " while committing; re-run the command");
  }
  storage.write(consts::kHeadFile, next);
}

} // namespace zit
