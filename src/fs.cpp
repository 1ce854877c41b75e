#include "zit/fs.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace zit::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::string read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::string buf{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  return buf;
}

namespace {

std::atomic<unsigned> temp_seq{0};

// Sibling temp name unique to this writer: <name>.tmp.<pid>.<seq>
std::filesystem::path temp_path_for(const std::filesystem::path &p) {
  auto tmp = p;
  tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(temp_seq++);
  return tmp;
}

void write_all(const std::filesystem::path &p, std::string_view data) {
  const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
  if (fd < 0) {
    throw std::runtime_error("create failed: " + p.string() + ": " + std::strerror(errno));
  }
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const std::string why = std::strerror(errno);
      ::close(fd);
      ::unlink(p.c_str());
      throw std::runtime_error("write failed: " + p.string() + ": " + why);
    }
    off += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) {
    const std::string why = std::strerror(errno);
    ::unlink(p.c_str());
    throw std::runtime_error("close failed: " + p.string() + ": " + why);
  }
}

} // namespace

void write_file_atomic(const std::filesystem::path &p, std::string_view data) {
  ensure_parent_dir(p);
  const auto tmp = temp_path_for(p);
  write_all(tmp, data);
  if (::rename(tmp.c_str(), p.c_str()) != 0) {
    const std::string why = std::strerror(errno);
    ::unlink(tmp.c_str());
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + why);
  }
}

bool write_file_exclusive(const std::filesystem::path &p, std::string_view data) {
  ensure_parent_dir(p);
  const auto tmp = temp_path_for(p);
  write_all(tmp, data);
  // link() publishes the complete file under `p` or fails if `p` exists.
  const int rc = ::link(tmp.c_str(), p.c_str());
  const int err = errno;
  ::unlink(tmp.c_str());
  if (rc != 0) {
    if (err == EEXIST)
      return false;
    throw std::runtime_error("create failed: " + p.string() + ": " + std::strerror(err));
  }
  return true;
}

} // namespace zit::fs
