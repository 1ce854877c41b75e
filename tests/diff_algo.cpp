#include "zit/diff.hpp"

#include <iostream>
#include <string>
#include <vector>

using zit::diff::Hunk;
using zit::diff::HunkKind;

// Rebuild the old (a) and new (b) sides from the hunks.
static void replay(const std::vector<Hunk> &hunks, std::vector<std::string> &a,
                   std::vector<std::string> &b) {
  for (const auto &h : hunks) {
    for (const auto &line : h.lines) {
      if (h.kind != HunkKind::Added)
        a.push_back(line);
      if (h.kind != HunkKind::Removed)
        b.push_back(line);
    }
  }
}

static std::size_t count(const std::vector<Hunk> &hunks, HunkKind kind) {
  std::size_t n = 0;
  for (const auto &h : hunks)
    if (h.kind == kind)
      n += h.lines.size();
  return n;
}

int main() {
  using zit::diff::diff_lines;
  using zit::diff::split_lines;

  {
    const auto a = split_lines("hello\n");
    const auto b = split_lines("hello\nworld\n");
    const auto hunks = diff_lines(a, b);
    if (hunks.size() != 2 || hunks[0].kind != HunkKind::Unchanged ||
        hunks[0].lines != std::vector<std::string>{"hello"} || hunks[1].kind != HunkKind::Added ||
        hunks[1].lines != std::vector<std::string>{"world"}) {
      std::cerr << "hello/world diff mismatch\n";
      return 1;
    }
  }

  {
    const auto a = split_lines("line1\nline2\nline3\n");
    const auto b = split_lines("line1\nlineZ\nline3\nline4\n");
    const auto hunks = diff_lines(a, b);
    std::vector<std::string> ra, rb;
    replay(hunks, ra, rb);
    if (ra != a || rb != b) {
      std::cerr << "hunks do not replay to the inputs\n";
      return 1;
    }
    // LCS is {line1, line3}: one removal, two additions
    if (count(hunks, HunkKind::Unchanged) != 2 || count(hunks, HunkKind::Removed) != 1 ||
        count(hunks, HunkKind::Added) != 2) {
      std::cerr << "edit script is not minimal\n";
      return 1;
    }
    if (hunks.front().kind != HunkKind::Unchanged || hunks.back().kind != HunkKind::Added ||
        hunks.back().lines.back() != "line4") {
      std::cerr << "hunk order does not follow the file\n";
      return 1;
    }
  }

  {
    // Everything removed / everything added / both empty
    const std::vector<std::string> abc{"a", "b", "c"};
    const auto gone = diff_lines(abc, {});
    if (gone.size() != 1 || gone[0].kind != HunkKind::Removed || gone[0].lines != abc) {
      std::cerr << "full removal mismatch\n";
      return 1;
    }
    const auto fresh = diff_lines({}, abc);
    if (fresh.size() != 1 || fresh[0].kind != HunkKind::Added || fresh[0].lines != abc) {
      std::cerr << "full addition mismatch\n";
      return 1;
    }
    if (!diff_lines({}, {}).empty() || !zit::diff::all_added({}).empty()) {
      std::cerr << "empty inputs produced hunks\n";
      return 1;
    }
  }

  {
    // Blank lines take part in alignment but are dropped for display
    const auto a = split_lines("x\n\ny\n");
    const auto b = split_lines("x\n\ny\n  \nz\n");
    const auto hunks = diff_lines(a, b);
    if (count(hunks, HunkKind::Unchanged) != 3 || count(hunks, HunkKind::Added) != 2) {
      std::cerr << "blank lines were not aligned\n";
      return 1;
    }
    const auto shown = zit::diff::visible_hunks(hunks);
    if (shown.size() != 2 || shown[0].lines != std::vector<std::string>{"x", "y"} ||
        shown[1].lines != std::vector<std::string>{"z"}) {
      std::cerr << "visible_hunks did not drop blank lines\n";
      return 1;
    }
  }

  {
    // Whole-file rewrite of a large file: no line in common
    std::vector<std::string> a, b;
    for (int i = 0; i < 8000; ++i) {
      a.push_back("old " + std::to_string(i));
      b.push_back("new " + std::to_string(i));
    }
    const auto hunks = diff_lines(a, b);
    if (hunks.size() != 2 || hunks[0].kind != HunkKind::Removed || hunks[0].lines != a ||
        hunks[1].kind != HunkKind::Added || hunks[1].lines != b) {
      std::cerr << "large rewrite mismatch\n";
      return 1;
    }
  }

  {
    // Large file with scattered edits: every 7th line replaced
    std::vector<std::string> a, b;
    std::size_t changed = 0;
    for (int i = 0; i < 6000; ++i) {
      a.push_back("line " + std::to_string(i));
      if (i % 7 == 3) {
        b.push_back("edited " + std::to_string(i));
        ++changed;
      } else {
        b.push_back(a.back());
      }
    }
    const auto hunks = diff_lines(a, b);
    std::vector<std::string> ra, rb;
    replay(hunks, ra, rb);
    if (ra != a || rb != b || count(hunks, HunkKind::Unchanged) != a.size() - changed ||
        count(hunks, HunkKind::Removed) != changed || count(hunks, HunkKind::Added) != changed) {
      std::cerr << "scattered edits mismatch\n";
      return 1;
    }
  }

  if (split_lines("a\r\nb").size() != 2 || !split_lines("").empty()) {
    std::cerr << "split_lines mismatch\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
