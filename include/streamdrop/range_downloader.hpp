#pragma once

#include "http_transport.hpp"
#include "progress.hpp"
#include "resource_descriptor.hpp"
#include "retry_policy.hpp"
#include "transfer_buffer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace streamdrop {

enum class RangeSupport {
    Unknown,
    Yes,
    No,
};

enum class SessionState {
    Running,
    Completed,
    Failed,
};

struct TransferSession {
    ResourceDescriptor resource;
    std::uint64_t downloaded_bytes{0};
    RangeSupport range_support{RangeSupport::Unknown};
    SessionState state{SessionState::Running};
    unsigned requests{0};
    unsigned transient_failures{0};
    unsigned fallbacks{0};
};

struct DownloadOptions {
    std::size_t block_size{4096};
    RetryPolicy retry{};
};

struct DownloadResult {
    std::string filename;
    ByteStream stream;
    TransferSession session;
};

// Pulls a remote resource into memory with ranged GETs, resuming from the last
// confirmed offset after network failures and falling back to a single full
// GET when the server ignores Range.
class RangeDownloader {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RangeDownloader(HttpTransport& transport, ProgressTracker& progress,
                    std::shared_ptr<spdlog::logger> logger, DownloadOptions options = {});

    // Replaces the sleep used between retries.
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    [[nodiscard]] DownloadResult download(const std::string& url);

private:
    class BlockWriter;

    ResourceDescriptor fetchMetadata(const std::string& url, TransferSession& session);
    void fetchRanges(TransferSession& session, TransferBuffer& buffer);
    void fetchFull(TransferSession& session, TransferBuffer& buffer);
    void waitBeforeRetry(TransferSession& session, const std::string& reason, unsigned failures);
    void restartProgress(const TransferSession& session);

    HttpTransport& transport_;
    ProgressTracker& progress_;
    std::shared_ptr<spdlog::logger> logger_;
    DownloadOptions options_;
    Sleeper sleeper_;
};

} // namespace streamdrop
