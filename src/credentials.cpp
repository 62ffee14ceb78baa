#include "tether/credentials.h"
#include "tether/error.h"
#include "tether/progress.h"
#include "tether/ssh_keys.h"
#include "internal.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <sstream>
#include <string>

namespace tether {

// ---------------------------------------------------------------------------
// secure_clear
// ---------------------------------------------------------------------------

void secure_clear(std::string& secret) {
    volatile char* p = secret.empty() ? nullptr : &secret[0];
    for (size_t i = 0; i < secret.size(); ++i) p[i] = '\0';
    secret.clear();
    secret.shrink_to_fit();
}

// ---------------------------------------------------------------------------
// Terminal prompter
// ---------------------------------------------------------------------------

std::optional<std::string> terminal_get_username(Ui& ui, const std::string& url) {
    try {
        return ui.prompt(fmt::format("Username for {}", url));
    } catch (const PromptError& e) {
        spdlog::debug("[auth] username prompt failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> terminal_get_password(Ui& ui, const std::string& url) {
    try {
        return ui.prompt_password(fmt::format("Passphrase for {}: ", url));
    } catch (const PromptError& e) {
        spdlog::debug("[auth] passphrase prompt failed: {}", e.what());
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// Git credential helper
// ---------------------------------------------------------------------------

namespace {

/// Run a shell command and return its stdout, or empty string on failure.
std::string run_cmd(const std::string& cmd) {
    FILE* fp = popen(cmd.c_str(), "r");
    if (!fp) return {};
    char buf[4096];
    std::string output;
    while (std::fgets(buf, sizeof(buf), fp)) output += buf;
    int status = pclose(fp);
    if (status != 0) {
        secure_clear(output);
        return {};
    }
    return output;
}

/// Trim trailing whitespace.
std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    return s;
}

/// Return true if hostname contains only safe characters.
bool hostname_safe(const std::string& h) {
    for (char c : h) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-')
            return false;
    }
    return !h.empty();
}

/// Return true if a username can be passed through printf unquoted.
bool username_safe(const std::string& u) {
    for (char c : u) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '.' && c != '-' && c != '_' && c != '@' && c != '+')
            return false;
    }
    return !u.empty();
}

} // anonymous namespace

std::optional<UserPassword> credential_helper_fill(const std::string& url,
                                                   const std::string& username_hint) {
    std::string protocol;
    if (url.compare(0, 8, "https://") == 0) protocol = "https";
    else if (url.compare(0, 7, "http://") == 0) protocol = "http";
    else return std::nullopt;

    auto after_scheme = url.substr(protocol.size() + 3);
    auto path_start = after_scheme.find('/');
    if (path_start == std::string::npos) path_start = after_scheme.size();
    auto authority = after_scheme.substr(0, path_start);

    // Drop any userinfo; the hint carries the username.
    auto at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) authority = authority.substr(at_pos + 1);

    auto colon_pos = authority.find(':');
    auto hostname = (colon_pos != std::string::npos) ? authority.substr(0, colon_pos) : authority;

    // Validate hostname to prevent shell injection
    if (!hostname_safe(hostname)) return std::nullopt;
    if (colon_pos != std::string::npos) {
        auto port = authority.substr(colon_pos + 1);
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
    }

    std::string input = "protocol=" + protocol + "\\nhost=" + authority + "\\n";
    if (username_safe(username_hint)) input += "username=" + username_hint + "\\n";
    input += "\\n";

    std::string cmd = "printf '" + input +
                      "' | GIT_TERMINAL_PROMPT=0 git credential fill 2>/dev/null";
    auto output = run_cmd(cmd);
    if (output.empty()) {
        spdlog::debug("[auth] no credential from git credential helper for {}", hostname);
        return std::nullopt;
    }

    UserPassword cred;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = line.substr(0, eq);
        if (key == "username") cred.username = rtrim(line.substr(eq + 1));
        if (key == "password") cred.password = rtrim(line.substr(eq + 1));
        secure_clear(line);
    }
    secure_clear(output);

    if (cred.username.empty() || cred.password.empty()) {
        secure_clear(cred.password);
        return std::nullopt;
    }
    spdlog::debug("[auth] using git credential helper for {}", hostname);
    return cred;
}

// ---------------------------------------------------------------------------
// CredentialResolver
// ---------------------------------------------------------------------------

CredentialResolver::CredentialResolver(Ui& ui, AuthOptions opts,
                                       std::unique_ptr<PassphraseSource> secure)
    : ui_(ui), opts_(std::move(opts)), secure_(std::move(secure)) {
    if (!secure_) secure_ = std::make_unique<Pinentry>(opts_.pinentry);
}

std::vector<std::filesystem::path>
CredentialResolver::get_ssh_keys(const std::string& username) {
    if (opts_.ssh_dir) {
        spdlog::debug("[ssh] looking up keys for user '{}' in {}",
                      username, opts_.ssh_dir->string());
        return find_ssh_keys_in(*opts_.ssh_dir);
    }
    return find_ssh_keys(username);
}

std::optional<std::string> CredentialResolver::get_password(const std::string& url,
                                                            const std::string& username) {
    spdlog::debug("[auth] passphrase requested for {} (user '{}')", url, username);
    if (auto pw = secure_->get_passphrase(url)) return pw;

    std::lock_guard<std::mutex> lk(ui_mutex_);
    return terminal_get_password(ui_, url);
}

std::optional<UserPassword>
CredentialResolver::get_username_password(const std::string& url) {
    spdlog::debug("[auth] username and password requested for {}", url);
    std::lock_guard<std::mutex> lk(ui_mutex_);

    auto username = terminal_get_username(ui_, url);
    if (!username) return std::nullopt;
    auto password = terminal_get_password(ui_, url);
    if (!password) return std::nullopt;
    return UserPassword{std::move(*username), std::move(*password)};
}

RemoteCallbacks CredentialResolver::callbacks() {
    RemoteCallbacks cbs;

    ProgressOutput* output = nullptr;
    {
        std::lock_guard<std::mutex> lk(ui_mutex_);
        output = ui_.progress_output();
    }
    if (output) {
        auto progress = std::make_shared<Progress>(Progress::Clock::now());
        cbs.progress = [this, output, progress](const TransferProgress& p) {
            std::lock_guard<std::mutex> lk(ui_mutex_);
            try {
                progress->update(Progress::Clock::now(), p, *output);
            } catch (const IoError& e) {
                spdlog::debug("[auth] progress output failed: {}", e.what());
            }
        };
    }

    cbs.get_ssh_keys = [this](const std::string& username) {
        return get_ssh_keys(username);
    };
    cbs.get_password = [this](const std::string& url, const std::string& username) {
        return get_password(url, username);
    };
    cbs.get_username_password = [this](const std::string& url) {
        return get_username_password(url);
    };
    return cbs;
}

} // namespace tether
