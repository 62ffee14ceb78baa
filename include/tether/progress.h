#pragma once

/// @file progress.h
/// Rate-limited rendering of transfer progress events.

#include "types.h"
#include "ui.h"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace tether {

/// Exponentially smoothed byte rate over unevenly spaced samples.
class RateEstimate {
public:
    using Clock = std::chrono::steady_clock;

    /// Feed the running byte total observed at @p now.
    /// @return Smoothed bytes/second, or nullopt for the first sample.
    std::optional<float> update(Clock::time_point now, uint64_t total);

private:
    struct State {
        uint64_t             total;
        std::optional<float> avg_rate;
        Clock::time_point    last_sample;
    };
    std::optional<State> state_;
};

/// Renders TransferProgress events as a single self-overwriting line.
///
/// Nothing is drawn during the first 250 ms, then at most 30 times per
/// second.  A finished transfer clears the line.
class Progress {
public:
    using Clock = std::chrono::steady_clock;

    explicit Progress(Clock::time_point now);

    /// Render @p progress to @p output if it is time to.
    /// @throws IoError if writing fails.
    void update(Clock::time_point now, const TransferProgress& progress,
                ProgressOutput& output);

private:
    Clock::time_point next_print_;
    RateEstimate      rate_;
    std::string       buffer_;
};

/// Scale @p x by powers of 1024, returning the value and its prefix
/// ("", "Ki", "Mi", ...).
std::pair<float, const char*> binary_prefix(float x);

/// Append a bar of @p width cells filled to @p progress (0..1) using
/// eighth-block characters.
void draw_progress(float progress, std::string& buffer, size_t width);

} // namespace tether
