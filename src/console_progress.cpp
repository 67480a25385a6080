#include "rangexfer/console_progress.hpp"

#include <filesystem>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace rangexfer {

ConsoleProgress::ConsoleProgress(std::string name, std::ostream& out)
    : name_(std::move(name)), out_(out) {}

void ConsoleProgress::update(const ProgressSample& sample) {
    const std::string line = formatLine(name_, sample);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << '\r' << line;
    // Blank out the tail of a longer previous line.
    if (line.size() < last_width_) {
        out_ << std::string(last_width_ - line.size(), ' ');
    }
    out_ << std::flush;
    last_width_ = line.size();
    drawn_ = true;
}

void ConsoleProgress::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        out_ << '\n' << std::flush;
        drawn_ = false;
        last_width_ = 0;
    }
}

std::string ConsoleProgress::formatLine(const std::string& name, const ProgressSample& sample) {
    std::string display_name;
    if (!name.empty()) {
        display_name = std::filesystem::path{name}.filename().string();
    }
    if (display_name.empty()) {
        display_name = name;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (sample.total < 0) {
        if (sample.transferred == 0) {
            return fmt::format("{:<20} [Initializing...]", display_name);
        }
        return fmt::format("{:<20} [size unknown] {} {}", display_name, formatSize(sample.transferred),
                           formatRate(sample.rate));
    }

    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(sample.percent / 100.0 * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    return fmt::format("{:<20} [{}] {:>3}% ({}/{}) {}", display_name, bar, static_cast<int>(sample.percent),
                       formatSize(sample.transferred), formatSize(sample.total), formatRate(sample.rate));
}

std::string ConsoleProgress::formatSize(std::int64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string ConsoleProgress::formatRate(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return formatSize(static_cast<std::int64_t>(bytes_per_second)) + "/s";
}

} // namespace rangexfer
