#pragma once

/// @file paths.h
/// Path helpers for configuration values.

#include <filesystem>
#include <string>

namespace tether {

/// Expand a leading "~/" to "$HOME/", as git does for e.g. core.excludesFile.
///
/// Paths without the prefix, and all paths when HOME is unset, are
/// returned unchanged.
std::filesystem::path expand_git_path(const std::string& path);

} // namespace tether
