#include "tether/backend.h"
#include "internal.h"

#include <git2.h>

#include <string>

namespace tether {

// ---------------------------------------------------------------------------
// libgit2 lifecycle, initialised once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;
} // anonymous namespace

void throw_git(const std::string& ctx) {
    const git_error* e = git_error_last();
    std::string msg = ctx;
    if (e && e->message) { msg += ": "; msg += e->message; }
    throw GitError(msg);
}

// ---------------------------------------------------------------------------
// Backend
// ---------------------------------------------------------------------------

git_repository* get_git_repo(const Backend& backend) {
    git_repository* repo = backend.git_repo();
    if (!repo) throw UnsupportedBackendError("The repo is not backed by a git repo");
    return repo;
}

// ---------------------------------------------------------------------------
// GitBackend
// ---------------------------------------------------------------------------

GitBackend::GitBackend(git_repository* repo, std::filesystem::path path)
    : repo_(repo), path_(std::move(path)) {}

GitBackend::~GitBackend() {
    if (repo_) git_repository_free(repo_);
}

std::unique_ptr<GitBackend> GitBackend::open(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw NotFoundError(path.string());
    }

    git_repository* repo = nullptr;
    if (git_repository_open_ext(&repo, path.string().c_str(), 0, nullptr) != 0) {
        throw_git("git_repository_open_ext");
    }
    std::filesystem::path gitdir = git_repository_path(repo);
    return std::unique_ptr<GitBackend>(new GitBackend(repo, std::move(gitdir)));
}

std::unique_ptr<GitBackend> GitBackend::init_bare(const std::filesystem::path& path) {
    std::filesystem::create_directories(path);
    git_repository* repo = nullptr;
    if (git_repository_init(&repo, path.string().c_str(), 1 /*bare*/) != 0) {
        throw_git("git_repository_init");
    }
    std::filesystem::path gitdir = git_repository_path(repo);
    return std::unique_ptr<GitBackend>(new GitBackend(repo, std::move(gitdir)));
}

} // namespace tether
