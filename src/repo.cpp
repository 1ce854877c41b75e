#include "zit/repo.hpp"

#include "zit/errors.hpp"
#include "zit/fs.hpp"
#include "zit/hash.hpp"
#include "zit/index.hpp"
#include "zit/refs.hpp"
#include "zit/time.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace zfs   = zit::fs;

namespace {

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool all_hex(std::string_view s) {
  return std::ranges::all_of(s,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

} // namespace

namespace zit {

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), storage_(std::make_unique<DiskStorage>(root_ / consts::kRepoDir)) {}

Repository::Repository(stdfs::path root, std::unique_ptr<Storage> storage)
    : root_(std::move(root)), storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("Repository: storage must not be null");
  }
}

auto Repository::is_initialized() const -> bool { return storage_->exists(consts::kHeadFile); }

void Repository::require_initialized(std::string_view op) const {
  if (!is_initialized()) {
    throw NotARepository(std::string(op) + ": not a zit repository (run `zit init`)");
  }
}

void Repository::trace(const std::string &event) const {
  if (trace_) {
    trace_(event);
  }
}

void Repository::init() {
  if (is_initialized()) {
    throw AlreadyInitialized("Already initialized .zit folder");
  }
  storage_->make_dir(consts::kObjectsDir);
  const bool head_created = storage_->create(consts::kHeadFile, "");
  const bool index_created = storage_->create(consts::kIndexFile, "[]");
  if (!head_created || !index_created) {
    throw AlreadyInitialized("Already initialized .zit folder");
  }
  trace("init " + repo_dir().string());
}

// Staging

std::string Repository::add(const stdfs::path &path) {
  require_initialized("add");

  const stdfs::path abs = path.is_absolute() ? path : root_ / path;
  const std::string rel = path.generic_string();
  std::error_code ec;
  if (!stdfs::is_regular_file(abs, ec)) {
    throw MissingWorkingFile("cannot read '" + rel + "': no such regular file");
  }
  std::string content;
  try {
    content = zfs::read_file(abs);
  } catch (const std::runtime_error &e) {
    throw MissingWorkingFile("cannot read '" + rel + "': " + e.what());
  }

  // Load first so a corrupt index fails the add before anything is written.
  Index idx{*storage_};
  idx.load();

  const std::string hex = objects().put(content);
  trace("object " + hex);
  idx.add_path(rel, hex);
  trace("stage " + rel + " " + hex);
  return hex;
}

// Commits

std::optional<std::string> Repository::head() const { return read_head(*storage_); }

std::string Repository::commit(std::string_view message) {
  require_initialized("commit");

  Index idx{*storage_};
  idx.load();
  const auto parent = head();

  const CommitRecord record{.timestamp = timeutil::iso8601_utc_now(),
                            .message = std::string(message),
                            .files = idx.entries(),
                            .parent = parent};

  const std::string commit_hex = objects().put(serialize_commit(record));
  trace("object " + commit_hex);

  update_head(*storage_, parent, commit_hex);
  trace("HEAD " + commit_hex);

  idx.clear();
  trace("index cleared");
  return commit_hex;
}

CommitRecord Repository::read_commit(std::string_view commit_hex) const {
  return parse_commit(objects().get(commit_hex));
}

// History

CommitWalk Repository::log() const { return CommitWalk{objects(), head()}; }

CommitDiff Repository::diff(std::string_view commit_hex) const {
  return diff_commit(objects(), commit_hex);
}

std::string Repository::resolve(std::string_view rev) const {
  if (looks_hex40(rev)) {
    return to_lower(rev);
  }
  if (rev.size() < consts::kMinPrefixLen || rev.size() > consts::kOidHexLen || !all_hex(rev)) {
    throw NotFound("unknown revision '" + std::string(rev) + "'");
  }
  const std::string prefix = to_lower(rev);
  std::vector<std::string> matches;
  for (const auto &entry : log()) {
    if (entry.digest.starts_with(prefix)) {
      matches.push_back(entry.digest);
    }
  }
  if (matches.empty()) {
    throw NotFound("unknown revision '" + std::string(rev) + "'");
  }
  if (matches.size() > 1) {
    throw Error("ambiguous revision '" + std::string(rev) + "': " +
                std::to_string(matches.size()) + " commits match");
  }
  return matches.front();
}

Settings Repository::settings() const { return load_settings(*storage_); }

} // namespace zit
