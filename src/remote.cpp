#include "tether/remote.h"
#include "tether/error.h"
#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace tether {

namespace {

// Hard stop for servers that keep rejecting whatever we hand them.
constexpr int MAX_AUTH_ATTEMPTS = 16;

// ---------------------------------------------------------------------------
// C trampolines
// ---------------------------------------------------------------------------

int credentials_cb(git_credential** out, const char* url,
                   const char* username_from_url, unsigned int allowed_types,
                   void* payload) {
    auto* session = static_cast<CallbackSession*>(payload);
    return session->acquire(out, url, username_from_url, allowed_types);
}

int transfer_progress_cb(const git_indexer_progress* stats, void* payload) {
    auto* session = static_cast<CallbackSession*>(payload);
    return session->progress(to_transfer_progress(*stats));
}

int push_transfer_progress_cb(unsigned int current, unsigned int total,
                              size_t bytes, void* payload) {
    auto* session = static_cast<CallbackSession*>(payload);
    return session->progress(to_push_progress(current, total, bytes));
}

int push_update_reference_cb(const char* refname, const char* status, void* payload) {
    auto* session = static_cast<CallbackSession*>(payload);
    session->record_push_status(refname, status);
    return 0;
}

// ---------------------------------------------------------------------------
// Remote lookup
// ---------------------------------------------------------------------------

/// Look up a configured remote by name, or treat @p remote as a URL/path.
git_remote* open_remote(git_repository* repo, const std::string& remote) {
    git_remote* out = nullptr;
    if (git_remote_lookup(&out, repo, remote.c_str()) == 0) return out;

    if (git_remote_create_anonymous(&out, repo, remote.c_str()) != 0) {
        throw_git("git_remote_create_anonymous");
    }
    return out;
}

/// Borrowed view of refspec strings as a git_strarray.
struct RefspecArray {
    explicit RefspecArray(const std::vector<std::string>& specs) {
        ptrs.reserve(specs.size());
        for (auto& s : specs) ptrs.push_back(const_cast<char*>(s.c_str()));
        arr.strings = ptrs.data();
        arr.count = ptrs.size();
    }
    const git_strarray* get() const { return arr.count ? &arr : nullptr; }

    std::vector<char*> ptrs;
    git_strarray       arr;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Progress conversion
// ---------------------------------------------------------------------------

TransferProgress to_transfer_progress(const git_indexer_progress& stats) {
    TransferProgress p;
    auto total = static_cast<uint64_t>(stats.total_objects) + stats.total_deltas;
    auto done  = static_cast<uint64_t>(stats.indexed_objects) + stats.indexed_deltas;
    p.overall = total ? static_cast<float>(done) / static_cast<float>(total) : 0.0f;
    if (stats.received_objects < stats.total_objects) {
        p.bytes_transferred = static_cast<uint64_t>(stats.received_bytes);
    }
    return p;
}

TransferProgress to_push_progress(unsigned int current, unsigned int total, size_t bytes) {
    TransferProgress p;
    p.bytes_transferred = static_cast<uint64_t>(bytes);
    p.overall = total ? static_cast<float>(current) / static_cast<float>(total) : 0.0f;
    return p;
}

// ---------------------------------------------------------------------------
// CallbackSession
// ---------------------------------------------------------------------------

CallbackSession::CallbackSession(RemoteCallbacks& callbacks, const AuthOptions& opts)
    : callbacks_(callbacks), opts_(opts) {}

void CallbackSession::install(git_remote_callbacks& out) {
    out.credentials = credentials_cb;
    out.transfer_progress = transfer_progress_cb;
    out.push_transfer_progress = push_transfer_progress_cb;
    out.push_update_reference = push_update_reference_cb;
    out.payload = this;
}

int CallbackSession::acquire(git_credential** out, const char* url,
                             const char* username_from_url,
                             unsigned int allowed_types) {
    try {
        return acquire_impl(out, url ? url : "",
                            username_from_url ? username_from_url : "",
                            allowed_types);
    } catch (...) {
        if (!error_) error_ = std::current_exception();
        return GIT_EUSER;
    }
}

int CallbackSession::acquire_impl(git_credential** out, const std::string& url,
                                  const std::string& username,
                                  unsigned int allowed_types) {
    if (++attempts_ > MAX_AUTH_ATTEMPTS) {
        throw GitError("too many authentication attempts for " + url);
    }
    spdlog::debug("[remote] credentials requested for {} (user '{}', types {:#x})",
                  url, username, allowed_types);

    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (opts_.use_credential_helper && !tried_helper_) {
            tried_helper_ = true;
            if (auto cred = credential_helper_fill(url, username)) {
                int rc = git_credential_userpass_plaintext_new(
                    out, cred->username.c_str(), cred->password.c_str());
                secure_clear(cred->password);
                return rc;
            }
        }
        if (!username.empty()) {
            if (callbacks_.get_password) {
                if (auto pw = callbacks_.get_password(url, username)) {
                    spdlog::debug("[remote] using userpass_plaintext with username from url");
                    int rc = git_credential_userpass_plaintext_new(
                        out, username.c_str(), pw->c_str());
                    secure_clear(*pw);
                    return rc;
                }
            }
        } else if (callbacks_.get_username_password) {
            if (auto cred = callbacks_.get_username_password(url)) {
                spdlog::debug("[remote] using userpass_plaintext for user '{}'", cred->username);
                int rc = git_credential_userpass_plaintext_new(
                    out, cred->username.c_str(), cred->password.c_str());
                secure_clear(cred->password);
                return rc;
            }
        }
    }

    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && !username.empty()) {
        // The agent is asked once; if its keys were refused, asking again
        // would loop forever.
        if (opts_.use_ssh_agent && !tried_agent_) {
            tried_agent_ = true;
            spdlog::debug("[remote] trying ssh_key_from_agent for '{}'", username);
            return git_credential_ssh_key_from_agent(out, username.c_str());
        }

        if (!ssh_keys_) {
            ssh_keys_ = callbacks_.get_ssh_keys
                            ? callbacks_.get_ssh_keys(username)
                            : std::vector<std::filesystem::path>{};
        }
        while (next_key_ < ssh_keys_->size()) {
            std::string path = (*ssh_keys_)[next_key_].string();
            if (!key_tried_plain_) {
                key_tried_plain_ = true;
                spdlog::debug("[remote] trying ssh_key {} for '{}'", path, username);
                return git_credential_ssh_key_new(out, username.c_str(), nullptr,
                                                  path.c_str(), nullptr);
            }

            // Refused without a passphrase: retry this key once with one.
            ++next_key_;
            key_tried_plain_ = false;
            if (!callbacks_.get_password) continue;
            if (auto pass = callbacks_.get_password(url, username)) {
                spdlog::debug("[remote] trying ssh_key {} with passphrase", path);
                int rc = git_credential_ssh_key_new(out, username.c_str(), nullptr,
                                                    path.c_str(), pass->c_str());
                secure_clear(*pass);
                return rc;
            }
        }
    }

    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && !username.empty()) {
        return git_credential_username_new(out, username.c_str());
    }

    spdlog::debug("[remote] using default credential");
    return git_credential_default_new(out);
}

int CallbackSession::progress(const TransferProgress& p) {
    if (!callbacks_.progress) return 0;
    try {
        callbacks_.progress(p);
        return 0;
    } catch (...) {
        if (!error_) error_ = std::current_exception();
        return -1;
    }
}

void CallbackSession::record_push_status(const char* refname, const char* status) {
    if (!status) return;
    std::string entry = refname ? refname : "(unknown ref)";
    entry += " (";
    entry += status;
    entry += ")";
    spdlog::debug("[remote] push rejected: {}", entry);
    rejected_.push_back(std::move(entry));
}

void CallbackSession::rethrow_if_failed() const {
    if (error_) std::rethrow_exception(error_);
}

// ---------------------------------------------------------------------------
// Network operations
// ---------------------------------------------------------------------------

void fetch(const Backend& backend, const std::string& remote,
           const std::vector<std::string>& refspecs,
           RemoteCallbacks& callbacks, const AuthOptions& opts) {
    git_repository* repo = get_git_repo(backend);
    git_remote* r = open_remote(repo, remote);

    CallbackSession session(callbacks, opts);
    git_fetch_options fetch_opts;
    git_fetch_options_init(&fetch_opts, GIT_FETCH_OPTIONS_VERSION);
    session.install(fetch_opts.callbacks);

    RefspecArray arr(refspecs);
    spdlog::debug("[remote] fetching from {}", remote);
    int rc = git_remote_fetch(r, arr.get(), &fetch_opts, "fetch");
    if (rc != 0) {
        // Capture libgit2's message before anything else can overwrite it.
        std::string ctx = "git_remote_fetch";
        const git_error* e = git_error_last();
        if (e && e->message) { ctx += ": "; ctx += e->message; }
        git_remote_free(r);
        session.rethrow_if_failed();
        throw GitError(ctx);
    }
    git_remote_free(r);
    session.rethrow_if_failed();
}

void push(const Backend& backend, const std::string& remote,
          const std::vector<std::string>& refspecs,
          RemoteCallbacks& callbacks, const AuthOptions& opts) {
    git_repository* repo = get_git_repo(backend);
    git_remote* r = open_remote(repo, remote);

    CallbackSession session(callbacks, opts);
    git_push_options push_opts;
    git_push_options_init(&push_opts, GIT_PUSH_OPTIONS_VERSION);
    session.install(push_opts.callbacks);

    RefspecArray arr(refspecs);
    spdlog::debug("[remote] pushing to {}", remote);
    int rc = git_remote_push(r, arr.get(), &push_opts);
    if (rc != 0) {
        std::string ctx = "git_remote_push";
        const git_error* e = git_error_last();
        if (e && e->message) { ctx += ": "; ctx += e->message; }
        git_remote_free(r);
        session.rethrow_if_failed();
        throw GitError(ctx);
    }
    git_remote_free(r);
    session.rethrow_if_failed();

    const auto& rejected = session.rejected_refs();
    if (!rejected.empty()) {
        std::string msg = "push rejected:";
        for (const auto& entry : rejected) msg += " " + entry;
        throw GitError(msg);
    }
}

} // namespace tether
