#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace streamdrop {

struct Progress {
    std::string label;
    std::uint64_t total_bytes{0};
    std::uint64_t transferred_bytes{0};
    bool is_running{false};
};

// Observer for bytes moved by a transfer. Implementations must never throw
// into the caller's control flow; a total of 0 means the size is unknown.
class ProgressTracker {
public:
    virtual ~ProgressTracker() = default;

    virtual void begin(std::uint64_t total, const std::string& label) = 0;
    virtual void advance(std::uint64_t bytes) = 0;
    virtual void end() = 0;
};

class NullProgress final : public ProgressTracker {
public:
    void begin(std::uint64_t, const std::string&) override {}
    void advance(std::uint64_t) override {}
    void end() override {}
};

// Single-line progress bar redrawn in place on a terminal stream.
class ConsoleProgress final : public ProgressTracker {
public:
    explicit ConsoleProgress(std::ostream& out,
                             std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(200));

    void begin(std::uint64_t total, const std::string& label) override;
    void advance(std::uint64_t bytes) override;
    void end() override;

    [[nodiscard]] Progress snapshot() const { return progress_; }

    static std::string formatLine(const Progress& progress);

private:
    void redraw();

    std::ostream& out_;
    std::chrono::milliseconds refresh_interval_;
    std::chrono::steady_clock::time_point last_draw_{};
    Progress progress_;
};

std::string formatSize(std::uint64_t bytes);

} // namespace streamdrop
