#pragma once

/// @file remote.h
/// libgit2 transport glue: installs RemoteCallbacks into libgit2 and runs
/// fetch / push with them.

#include "backend.h"
#include "credentials.h"
#include "types.h"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_credential;
struct git_indexer_progress;
struct git_remote_callbacks;

namespace tether {

/// Convert libgit2 fetch statistics into a progress event.
///
/// `overall` counts indexed objects and deltas against their totals;
/// `bytes_transferred` is set while objects are still arriving.
TransferProgress to_transfer_progress(const git_indexer_progress& stats);

/// Convert libgit2 push statistics into a progress event.
///
/// `overall` is @p current of @p total objects; `bytes_transferred` is the
/// number of bytes sent so far.
TransferProgress to_push_progress(unsigned int current, unsigned int total, size_t bytes);

// ---------------------------------------------------------------------------
// CallbackSession
// ---------------------------------------------------------------------------

/// Per-operation state behind the libgit2 callbacks.
///
/// libgit2 calls the credential callback again each time a credential is
/// rejected, so the session remembers how far down the chain it got:
///
///   1. user/password: git credential helper (once), then the password
///      callback when the URL names a user, else the username+password
///      callback;
///   2. SSH: ssh-agent (once), then each key from get_ssh_keys, first
///      without and then with a passphrase from the password callback;
///   3. username only: the user from the URL;
///   4. libgit2's default credential.
///
/// Exceptions raised by callbacks are held until rethrow_if_failed() so
/// they never unwind through libgit2.
class CallbackSession {
public:
    CallbackSession(RemoteCallbacks& callbacks, const AuthOptions& opts);

    CallbackSession(const CallbackSession&) = delete;
    CallbackSession& operator=(const CallbackSession&) = delete;

    /// Point @p out's callbacks and payload at this session.
    void install(git_remote_callbacks& out);

    /// libgit2 credential acquisition (see git_credential_acquire_cb).
    int acquire(git_credential** out, const char* url,
                const char* username_from_url, unsigned int allowed_types);

    /// Forward a progress event.  Returns non-zero to abort the transfer.
    int progress(const TransferProgress& p);

    /// Record the server's verdict for one pushed ref.
    void record_push_status(const char* refname, const char* status);

    /// Rethrow the first exception raised by a callback, if any.
    void rethrow_if_failed() const;

    /// Refs the server refused during push, as "ref (reason)".
    const std::vector<std::string>& rejected_refs() const { return rejected_; }

private:
    int acquire_impl(git_credential** out, const std::string& url,
                     const std::string& username, unsigned int allowed_types);

    RemoteCallbacks&   callbacks_;
    AuthOptions        opts_;
    int                attempts_ = 0;
    bool               tried_helper_ = false;
    bool               tried_agent_ = false;
    std::optional<std::vector<std::filesystem::path>> ssh_keys_;
    size_t             next_key_ = 0;
    bool               key_tried_plain_ = false;
    std::exception_ptr error_;
    std::vector<std::string> rejected_;
};

// ---------------------------------------------------------------------------
// Network operations
// ---------------------------------------------------------------------------

/// Fetch from @p remote (a configured remote name, a URL or a local path).
///
/// @param backend    Store to fetch into; must be backed by git.
/// @param remote     Remote name, URL or path.
/// @param refspecs   Refspecs to fetch; empty uses the remote's defaults.
/// @param callbacks  Credential and progress callbacks.
/// @param opts       Chain configuration (agent / credential helper).
/// @throws UnsupportedBackendError if the store is not backed by git.
/// @throws GitError on transport failures.
void fetch(const Backend& backend, const std::string& remote,
           const std::vector<std::string>& refspecs,
           RemoteCallbacks& callbacks, const AuthOptions& opts = {});

/// Push @p refspecs to @p remote.
///
/// @throws UnsupportedBackendError if the store is not backed by git.
/// @throws GitError on transport failures or when the server rejects
///         any ref.
void push(const Backend& backend, const std::string& remote,
          const std::vector<std::string>& refspecs,
          RemoteCallbacks& callbacks, const AuthOptions& opts = {});

} // namespace tether
