#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace zit {

class Storage;

// Current head digest; std::nullopt if HEAD is missing or empty.
// Throws CorruptState if HEAD holds anything but a 40-hex id.
std::optional<std::string> read_head(const Storage &storage);

// Move HEAD from `expected` to `next` under HEAD.lock.
// Throws LockHeld if the lock exists, HeadMoved if HEAD != expected.
void update_head(Storage &storage, const std::optional<std::string> &expected,
                 std::string_view next);

} // namespace zit
