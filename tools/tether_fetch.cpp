/**
 * Fetch from (or push to) a remote with interactive credential resolution.
 * Usage: tether-fetch [--push] <repo_dir> <remote> [refspec...]
 *
 * Environment:
 *   TETHER_LOG       spdlog level (trace, debug, info, warn, error, off)
 *   TETHER_PINENTRY  pinentry program to use
 *   TETHER_SSH_DIR   directory holding private keys (may start with ~/)
 */

#include <tether/tether.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--push] <repo_dir> <remote> [refspec...]\n";
}

static tether::AuthOptions options_from_env() {
    tether::AuthOptions opts;
    if (const char* prog = std::getenv("TETHER_PINENTRY")) {
        if (*prog) opts.pinentry.program = prog;
    }
    if (const char* dir = std::getenv("TETHER_SSH_DIR")) {
        if (*dir) opts.ssh_dir = tether::expand_git_path(dir);
    }
    return opts;
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);
    if (const char* lvl = std::getenv("TETHER_LOG")) {
        spdlog::set_level(spdlog::level::from_str(lvl));
    }

    int argi = 1;
    bool do_push = false;
    if (argi < argc && std::strcmp(argv[argi], "--push") == 0) {
        do_push = true;
        ++argi;
    }
    if (argc - argi < 2) {
        usage(argv[0]);
        return 2;
    }
    std::string repo_dir = argv[argi++];
    std::string remote = argv[argi++];
    std::vector<std::string> refspecs(argv + argi, argv + argc);

    tether::TerminalUi ui;
    try {
        auto backend = tether::GitBackend::open(repo_dir);
        auto opts = options_from_env();
        tether::with_remote_callbacks(ui, [&](tether::RemoteCallbacks& cbs) {
            if (do_push) {
                tether::push(*backend, remote, refspecs, cbs, opts);
            } else {
                tether::fetch(*backend, remote, refspecs, cbs, opts);
            }
        }, opts);
    } catch (const tether::TetherError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
