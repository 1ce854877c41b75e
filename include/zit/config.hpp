#pragma once
#include "zit/consts.hpp"

#include <cstddef>

namespace zit {

class Storage;

struct Settings {
  bool show_blank_lines = false;          // "blank-lines: show|hide"
  std::size_t abbrev = consts::kOidHexLen; // "abbrev: <4..40>"
};

// Read .zit/config (defaults if missing; unknown keys and bad values ignored)
Settings load_settings(const Storage &storage);

// Overwrite .zit/config with the given settings
void save_settings(Storage &storage, const Settings &settings);

} // namespace zit
