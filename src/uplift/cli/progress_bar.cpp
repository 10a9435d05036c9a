// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/cli/progress_bar.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace uplift::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0 || finished_) return;

    current_ = std::min(current, total_);
    speed_ = speed_bps;

    // Only redraw on whole-percent steps
    const int percent = static_cast<int>(current_ * 100 / total_);
    if (percent == last_percent_) return;
    last_percent_ = percent;

    draw(current_, speed_);
}

void ProgressBar::files(std::size_t done, std::size_t total) noexcept {
    files_done_ = done;
    files_total_ = total;
    if (!finished_ && total_ > 0) draw(current_, speed_);
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    draw(total_, 0);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

void ProgressBar::draw(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    try {
        const double percent = total_ == 0 ? 100.0
            : std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);

        std::string line = "\r";
        if (!label_.empty()) {
            line += label_;
            if (files_total_ > 0) line += fmt::format(" {}/{}", files_done_, files_total_);
            line += ": ";
        }

        line += render_bar(percent);
        line += fmt::format(" {:3}% ({}/{})", static_cast<int>(percent),
                            format_bytes(current), format_bytes(total_));

        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);

            const std::uint64_t remaining = total_ - std::min(current, total_);
            if (remaining > 0) {
                line += " ETA: ";
                line += format_time(remaining / speed_bps);
            }
        }

        // Clear rest of line
        line += std::string(10, ' ');
        std::cout << line << std::flush;
    } catch (const std::exception&) {
        // Progress output is best effort
    }
}

std::string ProgressBar::render_bar(double percent) const noexcept {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(std::max(empty, 0)), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return fmt::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return fmt::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return fmt::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return fmt::format("{} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    if (bytes >= GB) return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) noexcept {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

} // namespace uplift::cli
