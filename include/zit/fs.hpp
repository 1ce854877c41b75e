#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace zit::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::string read_file(const std::filesystem::path& p);

// Replace `p` with `data` via a per-writer temp file and rename.
void write_file_atomic(const std::filesystem::path& p, std::string_view data);

// Create `p` holding `data` only if it does not exist yet. The content is
// written to a temp file first and then hard-linked into place, so readers
// never see a partial file. Returns false, without touching `p`, when it
// already exists.
bool write_file_exclusive(const std::filesystem::path& p, std::string_view data);

} // namespace zit::fs
