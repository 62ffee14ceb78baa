#pragma once

#include "error.h"

#include <filesystem>
#include <memory>
#include <string>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;

namespace tether {

// ---------------------------------------------------------------------------
// Backend: storage abstraction with an optional git capability
// ---------------------------------------------------------------------------

/// A commit store.  Only some stores are git repositories; network
/// operations need one.
class Backend {
public:
    virtual ~Backend() = default;

    /// Short identifier of the store kind, e.g. "git".
    virtual std::string name() const = 0;

    /// Native libgit2 handle, or nullptr if this store is not backed by git.
    /// The handle stays owned by the backend.
    virtual git_repository* git_repo() const { return nullptr; }
};

/// Return the git repository behind @p backend.
/// @throws UnsupportedBackendError if the store is not backed by git.
git_repository* get_git_repo(const Backend& backend);

// ---------------------------------------------------------------------------
// GitBackend
// ---------------------------------------------------------------------------

/// A store backed by a git repository opened with libgit2.
///
/// Non-copyable; owns the libgit2 handle.
class GitBackend : public Backend {
public:
    /// Open the repository at (or containing) @p path.
    ///
    /// @throws NotFoundError if @p path does not exist.
    /// @throws GitError if no repository can be opened there.
    static std::unique_ptr<GitBackend> open(const std::filesystem::path& path);

    /// Create a new bare repository at @p path.
    /// @throws GitError on libgit2 failures.
    static std::unique_ptr<GitBackend> init_bare(const std::filesystem::path& path);

    ~GitBackend() override;

    GitBackend(const GitBackend&) = delete;
    GitBackend& operator=(const GitBackend&) = delete;

    std::string name() const override { return "git"; }
    git_repository* git_repo() const override { return repo_; }

    /// Path to the repository's git directory.
    const std::filesystem::path& path() const { return path_; }

private:
    GitBackend(git_repository* repo, std::filesystem::path path);

    git_repository*       repo_; ///< Raw libgit2 handle (owned).
    std::filesystem::path path_;
};

} // namespace tether
