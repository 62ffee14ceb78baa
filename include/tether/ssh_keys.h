#pragma once

/// @file ssh_keys.h
/// Discovery of the user's default SSH private keys.

#include <filesystem>
#include <string>
#include <vector>

namespace tether {

/// Key file names checked under the SSH directory, highest priority first.
inline constexpr const char* SSH_KEY_NAMES[] = {
    "id_ed25519_sk",
    "id_ed25519",
    "id_rsa",
};

/// Return existing private key files in ``~/.ssh``, in priority order.
///
/// An undiscoverable home directory gives an empty list, which callers
/// treat as "no keys" and fall through to other auth methods.
///
/// @param username  Remote user the keys are wanted for (logged only).
std::vector<std::filesystem::path> find_ssh_keys(const std::string& username);

/// Same as find_ssh_keys() but looks in @p ssh_dir instead of ``~/.ssh``.
std::vector<std::filesystem::path>
find_ssh_keys_in(const std::filesystem::path& ssh_dir);

} // namespace tether
