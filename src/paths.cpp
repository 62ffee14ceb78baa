#include "tether/paths.h"
#include "internal.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <string>

namespace tether {

std::filesystem::path expand_git_path(const std::string& path) {
    if (path.compare(0, 2, "~/") == 0) {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return std::filesystem::path(path);
}

namespace env {

std::optional<std::filesystem::path> home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::filesystem::path(home);

    // Fall back to the password database (e.g. under a stripped env).
    const struct passwd* pw = ::getpwuid(::getuid());
    if (pw && pw->pw_dir && *pw->pw_dir) return std::filesystem::path(pw->pw_dir);
    return std::nullopt;
}

} // namespace env

} // namespace tether
