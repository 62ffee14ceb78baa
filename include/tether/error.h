#pragma once

#include <stdexcept>
#include <string>

namespace tether {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all tether exceptions.
class TetherError : public std::runtime_error {
public:
    explicit TetherError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// A repository path was not found on disk.
class NotFoundError : public TetherError {
public:
    explicit NotFoundError(const std::string& path)
        : TetherError("not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// The store is not backed by a git repository, so no native handle
/// is available for network operations.
class UnsupportedBackendError : public TetherError {
public:
    explicit UnsupportedBackendError(const std::string& msg)
        : TetherError(msg) {}
};

/// The interaction surface cannot ask the user for input
/// (closed, not a terminal, end of input).
class PromptError : public TetherError {
public:
    explicit PromptError(const std::string& msg)
        : TetherError(msg) {}
};

/// A low-level libgit2 operation failed.
class GitError : public TetherError {
public:
    explicit GitError(const std::string& msg)
        : TetherError("git error: " + msg) {}
};

/// Writing to the output surface failed.
class IoError : public TetherError {
public:
    explicit IoError(const std::string& msg)
        : TetherError("io error: " + msg) {}
};

} // namespace tether
