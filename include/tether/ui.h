#pragma once

/// @file ui.h
/// The interaction surface: prompts, labeled diagnostics, progress output.

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <termios.h>

namespace tether {

// ---------------------------------------------------------------------------
// ProgressOutput
// ---------------------------------------------------------------------------

/// Destination for transient progress lines (normally a terminal).
class ProgressOutput {
public:
    virtual ~ProgressOutput() = default;

    /// Width of the terminal in columns, if known.
    virtual std::optional<uint16_t> term_width() const = 0;

    /// Write raw text (including control sequences) and flush.
    /// @throws IoError if the write fails.
    virtual void write(std::string_view text) = 0;
};

// ---------------------------------------------------------------------------
// Ui
// ---------------------------------------------------------------------------

/// User-facing interaction surface shared by every network callback.
///
/// Implementations need not be thread-safe; callers serialize access.
class Ui {
public:
    virtual ~Ui() = default;

    /// Ask for a line of plaintext input.
    /// @throws PromptError if no input can be read.
    virtual std::string prompt(const std::string& label) = 0;

    /// Ask for a line of input without echoing it.
    /// @throws PromptError if no input can be read.
    virtual std::string prompt_password(const std::string& label) = 0;

    /// Write unlabeled text to the diagnostic stream.
    /// @throws IoError if the write fails.
    virtual void write_stderr(std::string_view text) = 0;

    /// Write text styled by @p label ("warning", "hint", "branch", ...).
    /// @throws IoError if the write fails.
    virtual void write_labeled(const std::string& label, std::string_view text) = 0;

    /// Progress destination, or nullptr when progress is not shown.
    virtual ProgressOutput* progress_output() { return nullptr; }
};

// ---------------------------------------------------------------------------
// EchoOffGuard
// ---------------------------------------------------------------------------

/// RAII guard that turns echo off on terminal @p fd and restores the saved
/// mode.  Line buffering and queued input are left alone, so the password
/// is read as one line.  Does nothing if @p fd is not a terminal.
class EchoOffGuard {
public:
    explicit EchoOffGuard(int fd);
    ~EchoOffGuard();

    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;

    /// True if echo was turned off.
    bool active() const { return active_; }

private:
    int            fd_;
    struct termios saved_ {};
    bool           active_ = false;
};

// ---------------------------------------------------------------------------
// TerminalUi
// ---------------------------------------------------------------------------

/// Ui backed by standard input and standard error.
///
/// Prompts require an interactive input; password prompts turn echo off
/// for the duration of the read.  Labeled writes are coloured when the
/// output is a terminal.
class TerminalUi : public Ui {
public:
    /// Use stdin/stderr, detecting interactivity and colour with isatty().
    TerminalUi();

    /// Use the given streams.  Echo is never touched on these streams.
    TerminalUi(std::istream& in, std::ostream& err,
               bool interactive, bool color);

    ~TerminalUi() override;

    TerminalUi(const TerminalUi&) = delete;
    TerminalUi& operator=(const TerminalUi&) = delete;

    std::string prompt(const std::string& label) override;
    std::string prompt_password(const std::string& label) override;
    void write_stderr(std::string_view text) override;
    void write_labeled(const std::string& label, std::string_view text) override;
    ProgressOutput* progress_output() override;

private:
    std::string read_line();

    std::istream& in_;
    std::ostream& err_;
    bool          interactive_;
    bool          color_;
    bool          owns_tty_; ///< true when bound to the real stdin/stderr.
    std::unique_ptr<ProgressOutput> progress_;
};

} // namespace tether
