#include "streamdrop/progress.hpp"

#include <algorithm>
#include <ostream>

#include <fmt/format.h>

namespace streamdrop {

ConsoleProgress::ConsoleProgress(std::ostream& out, std::chrono::milliseconds refresh_interval)
    : out_(out), refresh_interval_(refresh_interval) {}

void ConsoleProgress::begin(std::uint64_t total, const std::string& label) {
    progress_ = Progress{label, total, 0, true};
    last_draw_ = {};
    redraw();
}

void ConsoleProgress::advance(std::uint64_t bytes) {
    if (!progress_.is_running) {
        return;
    }

    progress_.transferred_bytes += bytes;
    if (progress_.total_bytes > 0) {
        progress_.transferred_bytes = std::min(progress_.transferred_bytes, progress_.total_bytes);
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - last_draw_ >= refresh_interval_) {
        redraw();
    }
}

void ConsoleProgress::end() {
    if (!progress_.is_running) {
        return;
    }
    progress_.is_running = false;
    redraw();
    out_ << '\n' << std::flush;
}

void ConsoleProgress::redraw() {
    last_draw_ = std::chrono::steady_clock::now();
    out_ << "\r\033[K" << formatLine(progress_) << std::flush;
}

std::string ConsoleProgress::formatLine(const Progress& progress) {
    std::string display_name = progress.label;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    line.reserve(256);

    if (progress.total_bytes > 0) {
        const double ratio = static_cast<double>(progress.transferred_bytes) /
                             static_cast<double>(progress.total_bytes);
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            percent,
                            formatSize(progress.transferred_bytes),
                            formatSize(progress.total_bytes));
    } else {
        // Unknown size: show the byte count only.
        line += fmt::format("{:<20} [{} transferred]", display_name, formatSize(progress.transferred_bytes));
    }

    if (!progress.is_running) {
        line.append("  Done");
    }
    return line;
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace streamdrop
