// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace uplift::cli {

// Single-line progress bar for the aggregate of all uploads
class ProgressBar {
public:
    ProgressBar(std::uint64_t total, std::string_view label = {});

    // Update progress
    void update(std::uint64_t current, std::uint64_t speed_bps = 0) noexcept;

    // Files finished so far, shown next to the label
    void files(std::size_t done, std::size_t total) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string format_speed(std::uint64_t bps) noexcept;
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes) noexcept;
    [[nodiscard]] static std::string format_time(std::uint64_t seconds) noexcept;

private:
    [[nodiscard]] std::string render_bar(double percent) const noexcept;
    void draw(std::uint64_t current, std::uint64_t speed_bps) noexcept;

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    std::uint64_t speed_{0};
    int last_percent_{-1};
    std::size_t files_done_{0};
    std::size_t files_total_{0};
    std::string label_;
    bool finished_{false};
};

} // namespace uplift::cli
