#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// ---------------------------------------------------------------------------
// UserPassword
// ---------------------------------------------------------------------------

/// A username/password pair handed to the transport for HTTPS auth.
struct UserPassword {
    std::string username;
    std::string password;
};

// ---------------------------------------------------------------------------
// TransferProgress
// ---------------------------------------------------------------------------

/// One progress event emitted by the transport during fetch or push.
struct TransferProgress {
    /// Bytes received (fetch) or sent (push) so far.  Unset once a fetch
    /// has received every object.
    std::optional<uint64_t> bytes_transferred;
    float                   overall = 0.0f;   ///< Completion in [0, 1].
};

// ---------------------------------------------------------------------------
// GitImportStats
// ---------------------------------------------------------------------------

/// Outcome of importing refs from the git repository.
struct GitImportStats {
    /// Hex ids of commits that are no longer reachable after the import.
    std::vector<std::string> abandoned_commits;
};

// ---------------------------------------------------------------------------
// FailedRefExport
// ---------------------------------------------------------------------------

/// Why a ref could not be exported to the git repository.
struct FailedRefExportReason {
    enum class Kind : uint8_t {
        InvalidGitName,           ///< Name is not allowed in Git.
        OnRootCommit,             ///< Ref points to the virtual root commit.
        DeletedInJjModifiedInGit, ///< Deleted locally, modified in git.
        AddedInJjAddedInGit,      ///< Added on both sides with different targets.
        ModifiedInJjDeletedInGit, ///< Modified locally, deleted in git.
        FailedToDelete,           ///< libgit2 could not delete the ref.
        FailedToSet,              ///< libgit2 could not set the ref.
    };

    Kind               kind;
    std::exception_ptr source; ///< Underlying cause, may carry nested causes.

    /// Top-level message, without the cause chain.
    const char* message() const {
        switch (kind) {
            case Kind::InvalidGitName:
                return "Name is not allowed in Git";
            case Kind::OnRootCommit:
                return "Ref cannot point to the root commit in Git";
            case Kind::DeletedInJjModifiedInGit:
                return "Deleted ref had been modified in Git";
            case Kind::AddedInJjAddedInGit:
                return "Added ref had been added with a different target in Git";
            case Kind::ModifiedInJjDeletedInGit:
                return "Modified ref had been deleted in Git";
            case Kind::FailedToDelete:
                return "Failed to delete";
            case Kind::FailedToSet:
                return "Failed to set";
        }
        return "Unknown failure"; // unreachable
    }
};

/// A ref that could not be exported, with the reason.
struct FailedRefExport {
    std::string           name; ///< Short branch name, e.g. "main".
    FailedRefExportReason reason;
};

// ---------------------------------------------------------------------------
// PinentryOptions
// ---------------------------------------------------------------------------

/// Options for the secure-entry helper.
struct PinentryOptions {
    std::string program = "pinentry"; ///< Program name or path (PATH lookup).

    /// Give up on the helper after this long. Zero waits forever.
    std::chrono::milliseconds timeout = std::chrono::minutes(5);
};

// ---------------------------------------------------------------------------
// AuthOptions
// ---------------------------------------------------------------------------

/// Options controlling the credential-resolution chain.
struct AuthOptions {
    PinentryOptions                      pinentry;
    std::optional<std::filesystem::path> ssh_dir;  ///< Override ~/.ssh.
    bool use_ssh_agent         = true; ///< Try ssh-agent once before key files.
    bool use_credential_helper = true; ///< Ask `git credential fill` for HTTPS.
};

} // namespace tether
