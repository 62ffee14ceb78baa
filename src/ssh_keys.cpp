#include "tether/ssh_keys.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace tether {

std::vector<std::filesystem::path>
find_ssh_keys_in(const std::filesystem::path& ssh_dir) {
    std::vector<std::filesystem::path> paths;
    for (const char* filename : SSH_KEY_NAMES) {
        auto key_path = ssh_dir / filename;
        std::error_code ec;
        if (std::filesystem::is_regular_file(key_path, ec)) {
            spdlog::debug("[ssh] found ssh key: {}", key_path.string());
            paths.push_back(std::move(key_path));
        }
    }
    if (paths.empty()) {
        spdlog::debug("[ssh] no ssh key found");
    }
    return paths;
}

std::vector<std::filesystem::path> find_ssh_keys(const std::string& username) {
    spdlog::debug("[ssh] looking up keys for user '{}'", username);
    auto home = env::home_dir();
    if (!home) {
        spdlog::debug("[ssh] no ssh key found: home directory unknown");
        return {};
    }
    return find_ssh_keys_in(*home / ".ssh");
}

} // namespace tether
