#include "zit/history.hpp"

#include "zit/commit.hpp"
#include "zit/errors.hpp"

namespace zit {

CommitWalk::iterator CommitWalk::begin() {
  if (!started_) {
    started_ = true;
    advance();
  }
  return iterator{this};
}

std::optional<LogEntry> CommitWalk::next() {
  started_ = true;
  advance();
  return current_;
}

void CommitWalk::advance() {
  current_.reset();
  if (!next_ || !seen_.insert(*next_).second) {
    next_.reset();
    return;
  }
  const std::string digest = std::move(*next_);
  next_.reset();

  // An unknown or unreadable commit ends the history rather than failing it.
  if (!store_.contains(digest)) {
    stop_reason_ = "commit " + digest + " not found";
    return;
  }
  CommitRecord rec;
  try {
    rec = parse_commit(store_.get(digest));
  } catch (const CorruptState &e) {
    stop_reason_ = e.what();
    return;
  }
  next_ = std::move(rec.parent);
  current_ = LogEntry{.digest = digest,
                      .timestamp = std::move(rec.timestamp),
                      .message = std::move(rec.message)};
}

} // namespace zit
