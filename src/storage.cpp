#include "zit/storage.hpp"

#include "zit/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace zfs = zit::fs;

namespace zit {

// Disk

std::filesystem::path DiskStorage::path_for(std::string_view key) const {
  return dir_ / std::filesystem::path(key);
}

bool DiskStorage::exists(std::string_view key) const { return zfs::exists(path_for(key)); }

std::optional<std::string> DiskStorage::read(std::string_view key) const {
  const auto p = path_for(key);
  if (!zfs::exists(p)) {
    return std::nullopt;
  }
  return zfs::read_file(p);
}

void DiskStorage::write(std::string_view key, std::string_view data) {
  zfs::write_file_atomic(path_for(key), data);
}

bool DiskStorage::create(std::string_view key, std::string_view data) {
  return zfs::write_file_exclusive(path_for(key), data);
}

void DiskStorage::remove(std::string_view key) {
  std::error_code ec;
  std::filesystem::remove(path_for(key), ec);
  if (ec) {
    throw std::runtime_error("remove failed: " + path_for(key).string() + ": " + ec.message());
  }
}

void DiskStorage::make_dir(std::string_view dir) {
  std::error_code ec;
  std::filesystem::create_directories(path_for(dir), ec);
  if (ec) {
    throw std::runtime_error("create " + std::string(dir) + " dir failed: " + ec.message());
  }
}

std::vector<std::string> DiskStorage::list(std::string_view dir) const {
  std::vector<std::string> out;
  const auto p = path_for(dir);
  if (!zfs::exists(p)) {
    return out;
  }
  for (const auto &entry : std::filesystem::directory_iterator(p)) {
    if (entry.is_regular_file()) {
      out.push_back(entry.path().filename().string());
    }
  }
  std::ranges::sort(out);
  return out;
}

std::string DiskStorage::location(std::string_view key) const { return path_for(key).string(); }

// Memory

bool MemoryStorage::exists(std::string_view key) const { return files_.contains(key); }

std::optional<std::string> MemoryStorage::read(std::string_view key) const {
  const auto it = files_.find(key);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStorage::write(std::string_view key, std::string_view data) {
  files_.insert_or_assign(std::string(key), std::string(data));
  ++writes_;
}

bool MemoryStorage::create(std::string_view key, std::string_view data) {
  if (files_.contains(key)) {
    return false;
  }
  files_.emplace(std::string(key), std::string(data));
  ++writes_;
  return true;
}

void MemoryStorage::remove(std::string_view key) {
  if (const auto it = files_.find(key); it != files_.end()) {
    files_.erase(it);
  }
}

void MemoryStorage::make_dir(std::string_view /*dir*/) {}

std::vector<std::string> MemoryStorage::list(std::string_view dir) const {
  std::string prefix(dir);
  prefix.push_back('/');
  std::vector<std::string> out;
  for (auto it = files_.lower_bound(prefix); it != files_.end(); ++it) {
    if (!it->first.starts_with(prefix)) {
      break;
    }
    const std::string rest = it->first.substr(prefix.size());
    if (rest.find('/') == std::string::npos) {
      out.push_back(rest);
    }
  }
  return out;
}

} // namespace zit
