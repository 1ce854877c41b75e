#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace zit::diff {

enum class HunkKind : std::uint8_t { Unchanged, Added, Removed };

// A run of consecutive lines sharing one kind.
struct Hunk {
  HunkKind kind;
  std::vector<std::string> lines;
};

// Utility to split raw text into lines (keeps newlines trimmed).
std::vector<std::string> split_lines(std::string_view text);

// Line diff of `a` (old) against `b` (new), in file order.
// Adjacent operations of the same kind are merged into one hunk.
std::vector<Hunk> diff_lines(const std::vector<std::string>& a,
                             const std::vector<std::string>& b);

// Whole content as a single Added hunk (no hunk for empty content).
std::vector<Hunk> all_added(const std::vector<std::string>& lines);

// True for empty or whitespace-only lines.
bool is_blank(std::string_view line);

// Presentation filter: drops blank lines, then hunks left without lines.
std::vector<Hunk> visible_hunks(const std::vector<Hunk>& hunks);

} // namespace zit::diff
