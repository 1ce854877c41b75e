#pragma once
#include <stdexcept>
#include <string>

namespace zit {

// Base of every error the repository raises on purpose.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// init() on a directory that already holds a repository.
class AlreadyInitialized : public Error {
public:
  using Error::Error;
};

// Operation other than init() on a directory without a repository.
class NotARepository : public Error {
public:
  using Error::Error;
};

// Digest absent from the object store (or not a digest at all).
class NotFound : public Error {
public:
  using Error::Error;
};

// Index, HEAD or a commit record could not be parsed.
class CorruptState : public Error {
public:
  using Error::Error;
};

// add() of a path that cannot be read.
class MissingWorkingFile : public Error {
public:
  using Error::Error;
};

// HEAD no longer holds the digest a commit was built on.
class HeadMoved : public Error {
public:
  using Error::Error;
};

// Another process holds HEAD.lock.
class LockHeld : public Error {
public:
  using Error::Error;
};

} // namespace zit
