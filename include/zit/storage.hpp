#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zit {

/**
 * Key-value surface every piece of repository state goes through.
 * Keys are '/'-separated names relative to the repository directory,
 * e.g. "HEAD", "index", "objects/<hex>".
 */
class Storage {
public:
  virtual ~Storage() = default;

  [[nodiscard]] virtual bool exists(std::string_view key) const = 0;

  // std::nullopt if the key is absent.
  [[nodiscard]] virtual std::optional<std::string> read(std::string_view key) const = 0;

  // Create or replace.
  virtual void write(std::string_view key, std::string_view data) = 0;

  // Create only if absent; false (and no change) if the key exists.
  virtual bool create(std::string_view key, std::string_view data) = 0;

  // No error if absent.
  virtual void remove(std::string_view key) = 0;

  // Make sure a key prefix can hold entries (a directory on disk).
  virtual void make_dir(std::string_view dir) = 0;

  // Names directly under `dir`, sorted.
  [[nodiscard]] virtual std::vector<std::string> list(std::string_view dir) const = 0;

  // Where `key` lives, for messages.
  [[nodiscard]] virtual std::string location(std::string_view key) const = 0;
};

// Files under a repository directory (normally <root>/.zit).
class DiskStorage final : public Storage {
public:
  explicit DiskStorage(std::filesystem::path dir) : dir_(std::move(dir)) {}

  [[nodiscard]] const std::filesystem::path &dir() const { return dir_; }

  [[nodiscard]] bool exists(std::string_view key) const override;
  [[nodiscard]] std::optional<std::string> read(std::string_view key) const override;
  void write(std::string_view key, std::string_view data) override;
  bool create(std::string_view key, std::string_view data) override;
  void remove(std::string_view key) override;
  void make_dir(std::string_view dir) override;
  [[nodiscard]] std::vector<std::string> list(std::string_view dir) const override;
  [[nodiscard]] std::string location(std::string_view key) const override;

private:
  [[nodiscard]] std::filesystem::path path_for(std::string_view key) const;

  std::filesystem::path dir_;
};

// Process-local map; used by tests and anything that wants a throwaway repo.
class MemoryStorage final : public Storage {
public:
  [[nodiscard]] bool exists(std::string_view key) const override;
  [[nodiscard]] std::optional<std::string> read(std::string_view key) const override;
  void write(std::string_view key, std::string_view data) override;
  bool create(std::string_view key, std::string_view data) override;
  void remove(std::string_view key) override;
  void make_dir(std::string_view dir) override;
  [[nodiscard]] std::vector<std::string> list(std::string_view dir) const override;
  [[nodiscard]] std::string location(std::string_view key) const override {
    return std::string(key);
  }

  // Number of physical writes performed so far (create() included).
  [[nodiscard]] std::size_t write_count() const { return writes_; }

private:
  std::map<std::string, std::string, std::less<>> files_;
  std::size_t writes_ = 0;
};

} // namespace zit
