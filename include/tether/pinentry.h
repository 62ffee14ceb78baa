#pragma once

/// @file pinentry.h
/// Passphrase acquisition through an external pinentry helper.

#include "types.h"

#include <optional>
#include <string>

namespace tether {

// ---------------------------------------------------------------------------
// PassphraseSource
// ---------------------------------------------------------------------------

/// A strategy that can obtain a passphrase on its own, without the Ui.
///
/// Every failure is reported as nullopt so the caller can try the next
/// strategy.
class PassphraseSource {
public:
    virtual ~PassphraseSource() = default;

    /// Try to obtain the passphrase for @p url.
    virtual std::optional<std::string> get_passphrase(const std::string& url) = 0;
};

// ---------------------------------------------------------------------------
// Pinentry
// ---------------------------------------------------------------------------

/// Asks a pinentry program for the passphrase over the Assuan protocol.
///
/// The helper is spawned with piped stdin/stdout and sent:
/// @code
///     SETTITLE tether passphrase
///     SETDESC Enter passphrase for <url>
///     SETPROMPT Passphrase:
///     GETPIN
/// @endcode
/// The first `D ` line of its output carries the passphrase.  A missing
/// helper, a helper that answers without a `D ` line, a malformed payload
/// or an expired timeout all yield nullopt.
///
/// The timeout covers the whole exchange, including reaping the helper.
/// A helper that does not answer in time gets SIGTERM, then SIGKILL if it
/// ignores that.  One that lingers after closing its output is killed.
class Pinentry : public PassphraseSource {
public:
    explicit Pinentry(PinentryOptions opts = {});

    std::optional<std::string> get_passphrase(const std::string& url) override;

    const PinentryOptions& options() const { return opts_; }

private:
    PinentryOptions opts_;
};

/// Build the request script sent to the helper for @p url.
std::string pinentry_request(const std::string& url);

} // namespace tether
