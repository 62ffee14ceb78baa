#include "tether/ui.h"
#include "tether/error.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <iostream>
#include <istream>
#include <ostream>
#include <string>

namespace tether {

namespace {

// ---------------------------------------------------------------------------
// Terminal helpers
// ---------------------------------------------------------------------------

fmt::text_style style_for(const std::string& label) {
    if (label == "warning") return fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold;
    if (label == "error")   return fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
    if (label == "hint")    return fmt::fg(fmt::terminal_color::cyan);
    if (label == "branch")  return fmt::fg(fmt::terminal_color::magenta);
    return {};
}

/// Progress lines go straight to the stderr terminal.
class StderrProgressOutput : public ProgressOutput {
public:
    explicit StderrProgressOutput(std::ostream& err) : err_(err) {}

    std::optional<uint16_t> term_width() const override {
        struct winsize ws;
        if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
            return ws.ws_col;
        return std::nullopt;
    }

    void write(std::string_view text) override {
        err_.write(text.data(), static_cast<std::streamsize>(text.size()));
        err_.flush();
        if (!err_) throw IoError("cannot write progress");
    }

private:
    std::ostream& err_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// EchoOffGuard
// ---------------------------------------------------------------------------

EchoOffGuard::EchoOffGuard(int fd) : fd_(fd) {
    if (::tcgetattr(fd_, &saved_) != 0) return;
    struct termios quiet = saved_;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    quiet.c_lflag |= ECHONL;
    // TCSANOW keeps typeahead; the passphrase may already be queued.
    active_ = ::tcsetattr(fd_, TCSANOW, &quiet) == 0;
}

EchoOffGuard::~EchoOffGuard() {
    if (active_) ::tcsetattr(fd_, TCSANOW, &saved_);
}

// ---------------------------------------------------------------------------
// TerminalUi
// ---------------------------------------------------------------------------

TerminalUi::TerminalUi()
    : in_(std::cin), err_(std::cerr),
      interactive_(::isatty(STDIN_FILENO) != 0),
      color_(::isatty(STDERR_FILENO) != 0),
      owns_tty_(true) {
    if (color_) progress_ = std::make_unique<StderrProgressOutput>(err_);
}

TerminalUi::TerminalUi(std::istream& in, std::ostream& err,
                       bool interactive, bool color)
    : in_(in), err_(err), interactive_(interactive), color_(color),
      owns_tty_(false) {}

TerminalUi::~TerminalUi() = default;

std::string TerminalUi::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        throw PromptError("end of input while prompting");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string TerminalUi::prompt(const std::string& label) {
    if (!interactive_) {
        throw PromptError("Cannot prompt for input since the input is not "
                          "connected to a terminal");
    }
    write_stderr(label + ": ");
    err_.flush();
    return read_line();
}

std::string TerminalUi::prompt_password(const std::string& label) {
    if (!interactive_) {
        throw PromptError("Cannot prompt for input since the input is not "
                          "connected to a terminal");
    }
    write_stderr(label);
    err_.flush();
    if (!owns_tty_) return read_line();

    EchoOffGuard guard(STDIN_FILENO);
    return read_line();
}

void TerminalUi::write_stderr(std::string_view text) {
    err_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!err_) throw IoError("cannot write to stderr");
}

void TerminalUi::write_labeled(const std::string& label, std::string_view text) {
    if (!color_) {
        write_stderr(text);
        return;
    }
    // Style each line separately so the reset lands before the newline.
    std::string out;
    size_t start = 0;
    while (start < text.size()) {
        size_t eol = text.find('\n', start);
        size_t end = (eol == std::string_view::npos) ? text.size() : eol;
        if (end > start) {
            out += fmt::format(style_for(label), "{}", text.substr(start, end - start));
        }
        if (eol == std::string_view::npos) break;
        out += '\n';
        start = eol + 1;
    }
    write_stderr(out);
}

ProgressOutput* TerminalUi::progress_output() {
    return progress_.get();
}

} // namespace tether
