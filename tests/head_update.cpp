#include "zit/errors.hpp"
#include "zit/hash.hpp"
#include "zit/refs.hpp"
#include "zit/storage.hpp"

#include <iostream>
#include <optional>
#include <string>

int main() {
  zit::MemoryStorage storage;
  const auto c1 = zit::compute_digest("c1");
  const auto c2 = zit::compute_digest("c2");

  if (zit::read_head(storage)) {
    std::cerr << "missing HEAD should read as no commits\n";
    return 1;
  }
  storage.write("HEAD", "");
  if (zit::read_head(storage)) {
    std::cerr << "empty HEAD should read as no commits\n";
    return 1;
  }

  zit::update_head(storage, std::nullopt, c1);
  if (zit::read_head(storage) != c1 || storage.exists("HEAD.lock")) {
    std::cerr << "first head update failed or left the lock behind\n";
    return 1;
  }

  // Stale expectation: another writer got there first
  bool threw = false;
  try {
    zit::update_head(storage, std::nullopt, c2);
  } catch (const zit::HeadMoved &) {
    threw = true;
  }
  if (!threw || zit::read_head(storage) != c1 || storage.exists("HEAD.lock")) {
    std::cerr << "HEAD moved without compare-and-swap\n";
    return 1;
  }

  // Lock held by someone else
  storage.create("HEAD.lock", "");
  threw = false;
  try {
    zit::update_head(storage, c1, c2);
  } catch (const zit::LockHeld &) {
    threw = true;
  }
  if (!threw || zit::read_head(storage) != c1 || !storage.exists("HEAD.lock")) {
    std::cerr << "update ignored a held lock\n";
    return 1;
  }
  storage.remove("HEAD.lock");

  zit::update_head(storage, c1, c2);
  if (zit::read_head(storage) != c2) {
    std::cerr << "second head update failed\n";
    return 1;
  }

  // Trailing newline is tolerated, garbage is not
  storage.write("HEAD", c2 + "\n");
  if (zit::read_head(storage) != c2) {
    std::cerr << "HEAD with newline not accepted\n";
    return 1;
  }
  storage.write("HEAD", "ref: refs/heads/master\n");
  threw = false;
  try {
    (void)zit::read_head(storage);
  } catch (const zit::CorruptState &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "corrupt HEAD accepted\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
