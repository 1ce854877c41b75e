#include "zit/diff.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

namespace zit::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

namespace {

using Lines = std::vector<std::string>;

struct Split {
  int x;
  int y;
};

// Middle snake of a[a_lo, a_hi) against b[b_lo, b_hi) (Myers 1986, section 4b).
// Runs the forward and reverse searches together, keeping only the current
// V arrays, and returns the forward end point where they overlap. No split
// means the ranges have no line in common.
std::optional<Split> middle_snake(const Lines &a, int a_lo, int a_hi, const Lines &b, int b_lo,
                                  int b_hi) {
  const int N = a_hi - a_lo;
  const int M = b_hi - b_lo;
  const int max_d = (N + M + 1) / 2;
  const int OFFSET = max_d;
  const int len = 2 * max_d + 2;
  std::vector<int> vf(len, -1);
  std::vector<int> vb(len, -1);
  vf[OFFSET + 1] = 0;
  vb[OFFSET + 1] = 0;
  const int delta = N - M;
  const bool odd = (delta % 2) != 0;
  // Diagonals that ran off the grid are trimmed from both ends.
  int f_lo = 0, f_hi = 0, b_trim_lo = 0, b_trim_hi = 0;

  for (int d = 0; d < max_d; ++d) {
    for (int k = -d + f_lo; k <= d - f_hi; k += 2) {
      const int i = OFFSET + k;
      int x = (k == -d || (k != d && vf[i - 1] < vf[i + 1])) ? vf[i + 1] : vf[i - 1] + 1;
      int y = x - k;
      while (x < N && y < M && a[a_lo + x] == b[b_lo + y]) { ++x; ++y; }
      vf[i] = x;
      if (x > N) {
        f_hi += 2;
      } else if (y > M) {
        f_lo += 2;
      } else if (odd) {
        const int j = OFFSET + delta - k;
        if (j >= 0 && j < len && vb[j] != -1 && x >= N - vb[j]) {
          return Split{a_lo + x, b_lo + y};
        }
      }
    }
    // Reverse search: x and y count back from the end of each range.
    for (int k = -d + b_trim_lo; k <= d - b_trim_hi; k += 2) {
      const int i = OFFSET + k;
      int x = (k == -d || (k != d && vb[i - 1] < vb[i + 1])) ? vb[i + 1] : vb[i - 1] + 1;
      int y = x - k;
      while (x < N && y < M && a[a_hi - x - 1] == b[b_hi - y - 1]) { ++x; ++y; }
      vb[i] = x;
      if (x > N) {
        b_trim_hi += 2;
      } else if (y > M) {
        b_trim_lo += 2;
      } else if (!odd) {
        const int j = OFFSET + delta - k;
        if (j >= 0 && j < len && vf[j] != -1 && vf[j] >= N - x) {
          const int fx = vf[j];
          return Split{a_lo + fx, b_lo + fx - (j - OFFSET)};
        }
      }
    }
  }
  return std::nullopt;
}

// Linear-space Myers: ops for a[a_lo, a_hi) -> b[b_lo, b_hi), appended in
// file order. '=' keep, '-' del, '+' add.
void diff_range(const Lines &a, int a_lo, int a_hi, const Lines &b, int b_lo, int b_hi,
                std::vector<char> &ops) {
  while (a_lo < a_hi && b_lo < b_hi && a[a_lo] == b[b_lo]) {
    ops.push_back('=');
    ++a_lo;
    ++b_lo;
  }
  std::size_t common_tail = 0;
  while (a_lo < a_hi && b_lo < b_hi && a[a_hi - 1] == b[b_hi - 1]) {
    --a_hi;
    --b_hi;
    ++common_tail;
  }
  // With both ends trimmed and both sides non-empty at least two edits remain,
  // so the split point is strictly inside the box and both halves shrink.
  std::optional<Split> mid;
  if (a_lo < a_hi && b_lo < b_hi) {
    mid = middle_snake(a, a_lo, a_hi, b, b_lo, b_hi);
  }
  if (mid) {
    diff_range(a, a_lo, mid->x, b, b_lo, mid->y, ops);
    diff_range(a, mid->x, a_hi, b, mid->y, b_hi, ops);
  } else {
    ops.insert(ops.end(), static_cast<std::size_t>(a_hi - a_lo), '-');
    ops.insert(ops.end(), static_cast<std::size_t>(b_hi - b_lo), '+');
  }
  ops.insert(ops.end(), common_tail, '=');
}

std::vector<char> myers_diff(const Lines &a, const Lines &b) {
  std::vector<char> ops;
  ops.reserve(a.size() + b.size());
  diff_range(a, 0, static_cast<int>(a.size()), b, 0, static_cast<int>(b.size()), ops);
  return ops;
}

void push_line(std::vector<Hunk> &hunks, HunkKind kind, const std::string &line) {
  if (hunks.empty() || hunks.back().kind != kind) {
    hunks.push_back(Hunk{.kind = kind, .lines = {}});
  }
  hunks.back().lines.push_back(line);
}

} // namespace

std::vector<Hunk> diff_lines(const std::vector<std::string> &a,
                             const std::vector<std::string> &b) {
  std::vector<Hunk> hunks;
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const char op : myers_diff(a, b)) {
    if (op == '=') {
      push_line(hunks, HunkKind::Unchanged, b[ib]);
      ++ia;
      ++ib;
    } else if (op == '-') {
      push_line(hunks, HunkKind::Removed, a[ia++]);
    } else {
      push_line(hunks, HunkKind::Added, b[ib++]);
    }
  }
  return hunks;
}

std::vector<Hunk> all_added(const std::vector<std::string> &lines) {
  if (lines.empty()) {
    return {};
  }
  return {Hunk{.kind = HunkKind::Added, .lines = lines}};
}

bool is_blank(std::string_view line) {
  return std::ranges::all_of(line,
                             [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

std::vector<Hunk> visible_hunks(const std::vector<Hunk> &hunks) {
  std::vector<Hunk> out;
  for (const auto &h : hunks) {
    Hunk kept{.kind = h.kind, .lines = {}};
    std::ranges::copy_if(h.lines, std::back_inserter(kept.lines),
                         [](const std::string &line) { return !is_blank(line); });
    if (kept.lines.empty()) {
      continue;
    }
    // Removing a blank-only hunk can leave two hunks of one kind side by side.
    if (!out.empty() && out.back().kind == kept.kind) {
      auto &dst = out.back().lines;
      dst.insert(dst.end(), kept.lines.begin(), kept.lines.end());
    } else {
      out.push_back(std::move(kept));
    }
  }
  return out;
}

} // namespace zit::diff
