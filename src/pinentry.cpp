#include "tether/pinentry.h"
#include "tether/assuan.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {

namespace {

// ---------------------------------------------------------------------------
// File descriptor / process ownership
// ---------------------------------------------------------------------------

/// Owns one file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) { reset(); fd_ = o.fd_; o.fd_ = -1; }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int  get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

bool make_cloexec_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int pfd[2];
#ifdef __linux__
    if (::pipe2(pfd, O_CLOEXEC) != 0) return false;
#else
    if (::pipe(pfd) != 0) return false;
    ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
    ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
#endif
    read_end = UniqueFd(pfd[0]);
    write_end = UniqueFd(pfd[1]);
    return true;
}

using Clock = std::chrono::steady_clock;

// How long a helper gets to exit on its own (or after SIGTERM) before it
// is killed.
constexpr auto EXIT_GRACE = std::chrono::milliseconds(500);
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);

/// A spawned helper with its stdin and stdout connected to pipes.
/// The destructor terminates and reaps a child that was not reaped yet.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess() {
        if (pid_ > 0) {
            terminate();
            reap(Clock::now() + EXIT_GRACE);
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec @p program.  Returns false (with errno logged) when the
    /// program could not be started.
    bool spawn(const std::string& program) {
        UniqueFd in_r, in_w, out_r, out_w, status_r, status_w;
        if (!make_cloexec_pipe(in_r, in_w) ||
            !make_cloexec_pipe(out_r, out_w) ||
            !make_cloexec_pipe(status_r, status_w)) {
            spdlog::debug("[pinentry] pipe failed: {}", std::strerror(errno));
            return false;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            spdlog::debug("[pinentry] fork failed: {}", std::strerror(errno));
            return false;
        }

        if (pid == 0) {
            ::dup2(in_r.get(), STDIN_FILENO);
            ::dup2(out_w.get(), STDOUT_FILENO);
            char* argv[] = {const_cast<char*>(program.c_str()), nullptr};
            ::execvp(argv[0], argv);

            int err = errno;
            (void)!::write(status_w.get(), &err, sizeof(err));
            ::_exit(127);
        }

        pid_ = pid;
        status_w.reset();
        in_r.reset();
        out_w.reset();

        // exec succeeded iff the CLOEXEC status pipe closes without data.
        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(status_r.get(), &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        if (n > 0) {
            spdlog::debug("[pinentry] cannot run '{}': {}", program,
                          std::strerror(child_errno));
            reap(Clock::now() + EXIT_GRACE);
            return false;
        }

        stdin_ = std::move(in_w);
        stdout_ = std::move(out_r);
        return true;
    }

    int stdin_fd() const { return stdin_.get(); }
    int stdout_fd() const { return stdout_.get(); }
    void close_stdin() { stdin_.reset(); }

    /// Reap the child, polling until @p deadline.  A child still running
    /// then is sent SIGKILL and reaped.  Returns the raw wait status, or -1.
    int reap(Clock::time_point deadline) {
        if (pid_ <= 0) return -1;
        int status = 0;
        while (true) {
            pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc == pid_) {
                pid_ = -1;
                return status;
            }
            if (rc < 0 && errno != EINTR) {
                pid_ = -1;
                return -1;
            }
            if (rc == 0 && Clock::now() >= deadline) break;
            if (rc == 0) std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }

        spdlog::debug("[pinentry] helper still running; killing pid {}", pid_);
        ::kill(pid_, SIGKILL);
        return wait();
    }

    void terminate() {
        if (pid_ > 0) ::kill(pid_, SIGTERM);
    }

private:
    /// Blocking reap, for a child known to be exiting.
    int wait() {
        if (pid_ <= 0) return -1;
        int status = 0;
        pid_t rc;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);
        pid_ = -1;
        return rc < 0 ? -1 : status;
    }

    pid_t    pid_ = -1;
    UniqueFd stdin_;
    UniqueFd stdout_;
};

/// Blocks SIGPIPE on this thread while writing to a helper that may have
/// exited, and discards a SIGPIPE raised meanwhile.
class SigpipeBlocker {
public:
    SigpipeBlocker() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        sigpending(&pending_before_);
        ::pthread_sigmask(SIG_BLOCK, &set, &old_);
    }
    ~SigpipeBlocker() {
        if (!sigismember(&pending_before_, SIGPIPE)) {
            sigset_t pending;
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE)) {
                sigset_t set;
                sigemptyset(&set);
                sigaddset(&set, SIGPIPE);
                struct timespec zero = {0, 0};
                while (::sigtimedwait(&set, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SigpipeBlocker(const SigpipeBlocker&) = delete;
    SigpipeBlocker& operator=(const SigpipeBlocker&) = delete;

private:
    sigset_t old_;
    sigset_t pending_before_;
};

bool write_all(int fd, std::string_view data) {
    SigpipeBlocker guard;
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

/// Read until EOF.  Returns false if @p deadline passed first; no
/// deadline waits forever.
bool read_all(int fd, std::string& out, std::optional<Clock::time_point> deadline) {
    char buf[4096];

    while (true) {
        int wait_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Clock::now());
            if (left.count() <= 0) return false;
            wait_ms = static_cast<int>(left.count());
        }

        struct pollfd pfd = {fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return true; // treat as EOF; the caller still scans what arrived
        }
        if (rc == 0) return false;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return true;
        }
        if (n == 0) return true;
        out.append(buf, static_cast<size_t>(n));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Pinentry
// ---------------------------------------------------------------------------

std::string pinentry_request(const std::string& url) {
    return "SETTITLE tether passphrase\n"
           "SETDESC Enter passphrase for " + assuan::encode_data(url) + "\n"
           "SETPROMPT Passphrase:\n"
           "GETPIN\n";
}

Pinentry::Pinentry(PinentryOptions opts) : opts_(std::move(opts)) {}

std::optional<std::string> Pinentry::get_passphrase(const std::string& url) {
    std::optional<Clock::time_point> deadline;
    if (opts_.timeout.count() > 0) deadline = Clock::now() + opts_.timeout;

    ChildProcess child;
    if (!child.spawn(opts_.program)) return std::nullopt;

    if (!write_all(child.stdin_fd(), pinentry_request(url))) {
        spdlog::debug("[pinentry] cannot write request: {}", std::strerror(errno));
        return std::nullopt;
    }
    child.close_stdin();

    std::string out;
    bool finished = read_all(child.stdout_fd(), out, deadline);
    if (!finished) {
        spdlog::debug("[pinentry] '{}' did not answer within {} ms; giving up",
                      opts_.program, opts_.timeout.count());
        child.terminate();
        child.reap(Clock::now() + EXIT_GRACE);
        secure_clear(out);
        return std::nullopt;
    }

    // Exit status carries no meaning; the response lines do.  A helper
    // that closed its output but lingers is killed at the deadline.
    auto exit_by = Clock::now() + EXIT_GRACE;
    if (deadline && *deadline < exit_by) exit_by = *deadline;
    child.reap(exit_by);

    std::optional<std::string> result;
    bool found = false;
    size_t start = 0;
    while (start <= out.size()) {
        size_t eol = out.find('\n', start);
        size_t end = (eol == std::string::npos) ? out.size() : eol;
        std::string_view line(out.data() + start, end - start);
        if (line.compare(0, 2, "D ") == 0) {
            found = true;
            result = assuan::decode_data(line.substr(2));
            break;
        }
        if (eol == std::string::npos) break;
        start = eol + 1;
    }
    secure_clear(out);

    if (!found) {
        spdlog::debug("[pinentry] no data line in response");
    } else if (!result) {
        spdlog::debug("[pinentry] malformed data line in response");
    } else {
        spdlog::debug("[pinentry] passphrase obtained");
    }
    return result;
}

} // namespace tether
