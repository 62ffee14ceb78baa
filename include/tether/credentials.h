#pragma once

/// @file credentials.h
/// The credential-resolution chain handed to the network transport.

#include "pinentry.h"
#include "types.h"
#include "ui.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tether {

// ---------------------------------------------------------------------------
// RemoteCallbacks: what the transport may ask for
// ---------------------------------------------------------------------------

/// Callbacks the transport invokes during one fetch or push.
///
/// Every member is optional; an empty function means "not available".
/// Secrets are returned by value and belong to the caller afterwards.
struct RemoteCallbacks {
    /// Transfer progress events.
    std::function<void(const TransferProgress&)> progress;

    /// Candidate private key files for @p username, in the order to try.
    std::function<std::vector<std::filesystem::path>(const std::string& username)>
        get_ssh_keys;

    /// Passphrase or password for @p url, the user already being known.
    std::function<std::optional<std::string>(const std::string& url,
                                             const std::string& username)>
        get_password;

    /// Username and password for @p url.
    std::function<std::optional<UserPassword>(const std::string& url)>
        get_username_password;
};

// ---------------------------------------------------------------------------
// Terminal prompter
// ---------------------------------------------------------------------------

/// Prompt "Username for <url>".  nullopt if the Ui cannot prompt.
std::optional<std::string> terminal_get_username(Ui& ui, const std::string& url);

/// Prompt "Passphrase for <url>: " without echo.  nullopt if the Ui
/// cannot prompt.
std::optional<std::string> terminal_get_password(Ui& ui, const std::string& url);

// ---------------------------------------------------------------------------
// Git credential helper
// ---------------------------------------------------------------------------

/// Ask `git credential fill` for a username and password.
///
/// Only http(s) URLs with a plain host name are looked up.  Works with
/// whatever helper git is configured with (libsecret, osxkeychain,
/// `gh auth setup-git`, ...).
///
/// @param url            Remote URL.
/// @param username_hint  Username from the URL, or empty.
/// @return The credential, or nullopt if none is configured or the helper
///         failed.
std::optional<UserPassword> credential_helper_fill(const std::string& url,
                                                   const std::string& username_hint = {});

// ---------------------------------------------------------------------------
// CredentialResolver
// ---------------------------------------------------------------------------

/// Builds the RemoteCallbacks for one network operation.
///
/// Passphrases come from the secure prompt strategy first (pinentry by
/// default) and from the Ui otherwise; usernames and passwords always come
/// from the Ui.  All Ui access goes through one mutex, so a single prompt
/// is in flight at any time.
///
/// The resolver must outlive the callbacks it hands out.
class CredentialResolver {
public:
    /// @param ui      Interaction surface shared by every callback.
    /// @param opts    Chain configuration.
    /// @param secure  Secure prompt strategy; nullptr means pinentry
    ///                configured from @p opts.
    explicit CredentialResolver(Ui& ui, AuthOptions opts = {},
                                std::unique_ptr<PassphraseSource> secure = nullptr);

    CredentialResolver(const CredentialResolver&) = delete;
    CredentialResolver& operator=(const CredentialResolver&) = delete;

    /// Candidate SSH keys (the username is only logged).
    std::vector<std::filesystem::path> get_ssh_keys(const std::string& username);

    /// Secure prompt, then terminal prompt.
    std::optional<std::string> get_password(const std::string& url,
                                            const std::string& username);

    /// Terminal username prompt followed by terminal password prompt.
    std::optional<UserPassword> get_username_password(const std::string& url);

    /// Callbacks bound to this resolver.  `progress` is set only when the
    /// Ui has a progress output.
    RemoteCallbacks callbacks();

    const AuthOptions& options() const { return opts_; }

private:
    Ui&                               ui_;
    std::mutex                        ui_mutex_;
    AuthOptions                       opts_;
    std::unique_ptr<PassphraseSource> secure_;
};

/// Run @p f with remote callbacks that resolve credentials through @p ui.
///
/// @code
///     tether::TerminalUi ui;
///     tether::with_remote_callbacks(ui, [&](tether::RemoteCallbacks& cbs) {
///         tether::fetch(backend, "origin", {}, cbs);
///     });
/// @endcode
template <typename F>
auto with_remote_callbacks(Ui& ui, F&& f, AuthOptions opts = {})
    -> decltype(f(std::declval<RemoteCallbacks&>())) {
    CredentialResolver resolver(ui, std::move(opts));
    RemoteCallbacks callbacks = resolver.callbacks();
    return std::forward<F>(f)(callbacks);
}

} // namespace tether
