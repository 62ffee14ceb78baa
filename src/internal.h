#pragma once
/// Internal helpers shared between tether source files.
/// Not part of the public API.

#include "tether/error.h"

#include <filesystem>
#include <optional>
#include <string>

namespace tether {

// ---------------------------------------------------------------------------
// libgit2 error translation
// ---------------------------------------------------------------------------

/// Throw GitError carrying @p ctx and libgit2's last error message.
[[noreturn]] void throw_git(const std::string& ctx);

// ---------------------------------------------------------------------------
// secrets
// ---------------------------------------------------------------------------

/// Overwrite the bytes of @p secret before releasing it.
void secure_clear(std::string& secret);

// ---------------------------------------------------------------------------
// env: home directory lookup
// ---------------------------------------------------------------------------

namespace env {

/// $HOME, falling back to the password database.  nullopt if neither
/// yields a non-empty path.
std::optional<std::filesystem::path> home_dir();

} // namespace env

} // namespace tether
