#pragma once
#include "zit/object_store.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <set>
#include <string>

namespace zit {

struct LogEntry {
  std::string digest;
  std::string timestamp;
  std::string message;
};

/**
 * Lazy newest-first walk over the commit chain, one object read per step.
 * Starts at `start` and follows parent links until a root commit, a digest
 * that is not in the store, a record that does not parse, or a digest already
 * visited. The two failure cases end the walk quietly and leave a note in
 * stop_reason().
 */
class CommitWalk {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = LogEntry;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const LogEntry *;
    using reference         = const LogEntry &;

    iterator() = default;
    explicit iterator(CommitWalk *walk) : walk_(walk) {}

    reference operator*() const { return *walk_->current_; }
    pointer operator->() const { return &*walk_->current_; }
    iterator &operator++() {
      walk_->advance();
      return *this;
    }
    void operator++(int) { walk_->advance(); }

    bool operator==(const iterator &other) const {
      return done() == other.done() && (done() || walk_ == other.walk_);
    }

  private:
    [[nodiscard]] bool done() const { return walk_ == nullptr || !walk_->current_; }

    CommitWalk *walk_ = nullptr;
  };

  CommitWalk(ObjectStore store, std::optional<std::string> start)
    : store_(store), next_(std::move(start)) {}

  // Begins the walk on first call; later calls continue where it stands.
  iterator begin();
  iterator end() { return {}; }

  // Pull-style alternative to the iterator interface.
  std::optional<LogEntry> next();

  // Why the walk ended before reaching a root commit, if it did.
  [[nodiscard]] const std::optional<std::string> &stop_reason() const { return stop_reason_; }

private:
  void advance();

  ObjectStore store_;
  std::optional<std::string> next_;
  std::optional<LogEntry> current_;
  std::set<std::string> seen_;
  std::optional<std::string> stop_reason_;
  bool started_ = false;
};

} // namespace zit
