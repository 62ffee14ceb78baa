#include "tether/progress.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace tether {

namespace {

constexpr auto INITIAL_DELAY = std::chrono::milliseconds(250);
constexpr int  UPDATE_HZ = 30;

// Averaging window for the download rate, in seconds.
constexpr float RATE_TIME_WINDOW = 2.0f;

constexpr const char* CLEAR_LINE = "\x1b[2K";
constexpr const char* CLEAR_TO_EOL = "\x1b[K";

} // anonymous namespace

// ---------------------------------------------------------------------------
// RateEstimate
// ---------------------------------------------------------------------------

std::optional<float> RateEstimate::update(Clock::time_point now, uint64_t total) {
    if (!state_) {
        state_ = State{total, std::nullopt, now};
        return std::nullopt;
    }

    auto& s = *state_;
    float delta = static_cast<float>(total >= s.total ? total - s.total : 0);
    s.total = total;
    float dt = std::chrono::duration<float>(now - s.last_sample).count();
    s.last_sample = now;
    if (dt <= 0.0f) return s.avg_rate;

    float sample = delta / dt;
    if (!s.avg_rate) {
        s.avg_rate = sample;
    } else {
        // Eckner (2019), moving averages for unevenly spaced time series.
        float alpha = 1.0f - std::exp(-dt / RATE_TIME_WINDOW);
        *s.avg_rate += alpha * (sample - *s.avg_rate);
    }
    return s.avg_rate;
}

// ---------------------------------------------------------------------------
// Progress
// ---------------------------------------------------------------------------

Progress::Progress(Clock::time_point now) : next_print_(now + INITIAL_DELAY) {}

void Progress::update(Clock::time_point now, const TransferProgress& progress,
                      ProgressOutput& output) {
    if (progress.overall >= 1.0f) {
        output.write(std::string("\r") + CLEAR_LINE);
        return;
    }

    std::optional<float> rate;
    if (progress.bytes_transferred) {
        rate = rate_.update(now, *progress.bytes_transferred);
    }
    if (now < next_print_) return;
    next_print_ = now + std::chrono::duration_cast<Clock::duration>(
                            std::chrono::seconds(1)) / UPDATE_HZ;

    buffer_.clear();
    buffer_ += '\r';
    const size_t control_chars = buffer_.size();
    fmt::format_to(std::back_inserter(buffer_), "{:>3.0f}% ", 100.0f * progress.overall);
    if (progress.bytes_transferred) {
        auto [scaled, prefix] = binary_prefix(static_cast<float>(*progress.bytes_transferred));
        fmt::format_to(std::back_inserter(buffer_), "{:>5.1f} {}B ", scaled, prefix);
    }
    if (rate) {
        auto [scaled, prefix] = binary_prefix(*rate);
        fmt::format_to(std::back_inserter(buffer_), "at {:>5.1f} {}B/s ", scaled, prefix);
    }

    size_t used = buffer_.size() - control_chars + 2;
    size_t term_width = output.term_width().value_or(0);
    size_t bar_width = term_width > used ? term_width - used : 0;
    buffer_ += '[';
    draw_progress(progress.overall, buffer_, bar_width);
    buffer_ += ']';
    buffer_ += CLEAR_TO_EOL;

    output.write(buffer_);
}

// ---------------------------------------------------------------------------
// Formatting helpers
// ---------------------------------------------------------------------------

std::pair<float, const char*> binary_prefix(float x) {
    static const char* const table[] = {"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei", "Zi", "Yi"};
    constexpr size_t n = sizeof(table) / sizeof(table[0]);

    size_t i = 0;
    float scaled = x;
    while (std::fabs(scaled) >= 1024.0f && i + 1 < n) {
        ++i;
        scaled /= 1024.0f;
    }
    return {scaled, table[i]};
}

void draw_progress(float progress, std::string& buffer, size_t width) {
    static const char* const chars[] = {
        " ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█",
    };
    constexpr size_t resolution = 8;

    float clamped = std::clamp(progress, 0.0f, 1.0f);
    auto ticks = static_cast<size_t>(std::lround(
        static_cast<float>(width) * clamped * static_cast<float>(resolution)));
    size_t whole = ticks / resolution;
    for (size_t i = 0; i < whole; ++i) buffer += chars[resolution];
    if (whole < width) {
        buffer += chars[ticks % resolution];
    }
    for (size_t i = whole + 1; i < width; ++i) buffer += chars[0];
}

} // namespace tether
