#include "streamdrop/range_downloader.hpp"

#include "streamdrop/errors.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace streamdrop {

namespace {

constexpr long kPartialContent = 206;

bool isSuccessStatus(long status) {
    return status >= 200 && status < 300;
}

} // namespace

// Splits whatever the transport hands over into fixed-size blocks, appending
// each one to the buffer and reporting it to the progress tracker.
class RangeDownloader::BlockWriter final : public ResponseHandler {
public:
    enum class Mode {
        Partial,
        Full,
    };

    BlockWriter(RangeDownloader& owner, TransferSession& session, TransferBuffer& buffer, Mode mode)
        : owner_(owner), session_(session), buffer_(buffer), mode_(mode) {}

    bool onStatus(long status, const Headers& headers) override {
        status_ = status;
        if (mode_ == Mode::Partial) {
            if (status != kPartialContent) {
                return false;
            }
            // A 206 for some other offset would splice foreign bytes into the buffer.
            const auto start = contentRangeStart(headers);
            if (start && *start != session_.downloaded_bytes) {
                misplaced_start_ = start;
                return false;
            }
            return true;
        }
        return isSuccessStatus(status);
    }

    void onData(const char* data, std::size_t size) override {
        const std::uint64_t total = session_.resource.total_bytes;
        if (total > 0) {
            const std::uint64_t room = total - session_.downloaded_bytes;
            if (size > room) {
                discarded_ += size - room;
                size = static_cast<std::size_t>(room);
            }
        }

        const std::size_t block_size = std::max<std::size_t>(1, owner_.options_.block_size);
        while (size > 0) {
            const std::size_t block = std::min(size, block_size);
            buffer_.write(data, block);
            session_.downloaded_bytes += block;
            written_ += block;
            owner_.progress_.advance(block);
            data += block;
            size -= block;
        }
    }

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] std::uint64_t discarded() const noexcept { return discarded_; }
    [[nodiscard]] const std::optional<std::uint64_t>& misplacedStart() const noexcept { return misplaced_start_; }

private:
    RangeDownloader& owner_;
    TransferSession& session_;
    TransferBuffer& buffer_;
    Mode mode_;
    long status_{0};
    std::uint64_t written_{0};
    std::uint64_t discarded_{0};
    std::optional<std::uint64_t> misplaced_start_;
};

RangeDownloader::RangeDownloader(HttpTransport& transport, ProgressTracker& progress,
                                 std::shared_ptr<spdlog::logger> logger, DownloadOptions options)
    : transport_(transport),
      progress_(progress),
      logger_(std::move(logger)),
      options_(options),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

DownloadResult RangeDownloader::download(const std::string& url) {
    logger_->info("Start downloading {}", url);

    TransferSession session;
    session.resource.url = url;
    session.resource = fetchMetadata(url, session);
    logger_->debug("Resource {}: {} bytes declared, filename \"{}\"",
                   url, session.resource.total_bytes, session.resource.filename);

    TransferBuffer buffer;
    progress_.begin(session.resource.total_bytes, session.resource.filename);
    try {
        if (session.resource.total_bytes == 0) {
            logger_->warn("{} did not declare a length, reading until the body ends", url);
            fetchFull(session, buffer);
        } else {
            fetchRanges(session, buffer);
        }
    } catch (const Error&) {
        session.state = SessionState::Failed;
        progress_.end();
        throw;
    }
    progress_.end();

    session.state = SessionState::Completed;
    buffer.seekStart();
    logger_->info("Done downloading {} ({} bytes in {} requests, {} retries)",
                  session.resource.filename, session.downloaded_bytes,
                  session.requests, session.transient_failures);

    std::string filename = session.resource.filename;
    return DownloadResult{std::move(filename), std::move(buffer).asReadableStream(), std::move(session)};
}

ResourceDescriptor RangeDownloader::fetchMetadata(const std::string& url, TransferSession& session) {
    unsigned failures = 0;
    while (true) {
        HttpResponse response;
        try {
            ++session.requests;
            response = transport_.head(url);
        } catch (const TransientError& ex) {
            waitBeforeRetry(session, ex.what(), ++failures);
            continue;
        }

        logger_->debug("HEAD {} returned HTTP {}", url, response.status);
        if (!isSuccessStatus(response.status)) {
            throw TransferError(fmt::format("Metadata request for {} failed with HTTP {}", url, response.status),
                                url, response.status);
        }
        return describeResource(url, response);
    }
}

void RangeDownloader::fetchRanges(TransferSession& session, TransferBuffer& buffer) {
    const std::string& url = session.resource.url;
    const std::uint64_t total = session.resource.total_bytes;
    unsigned failures = 0;

    while (session.downloaded_bytes < total) {
        const ByteRange range{session.downloaded_bytes, total - 1};
        logger_->debug("Requesting bytes={}-{} of {}", range.first, range.last, url);

        BlockWriter writer{*this, session, buffer, BlockWriter::Mode::Partial};
        long status = 0;
        try {
            ++session.requests;
            status = transport_.get(url, range, writer);
        } catch (const TransientError& ex) {
            // Bytes that made it into the buffer stay there; the next range
            // starts right after them.
            failures = writer.written() > 0 ? 1 : failures + 1;
            waitBeforeRetry(session, ex.what(), failures);
            continue;
        }

        if (status == kPartialContent && writer.misplacedStart()) {
            session.range_support = RangeSupport::No;
            ++session.fallbacks;
            logger_->warn("Server answered bytes={}- of {} with a range starting at {}, downloading it whole",
                          range.first, url, *writer.misplacedStart());
            fetchFull(session, buffer);
            return;
        }

        if (status == kPartialContent) {
            session.range_support = RangeSupport::Yes;
            if (writer.discarded() > 0) {
                logger_->debug("Ignored {} bytes past the end of {}", writer.discarded(), url);
            }
            if (writer.written() == 0) {
                waitBeforeRetry(session, "server sent an empty partial response", ++failures);
                continue;
            }
            failures = 0;
            continue;
        }

        if (isSuccessStatus(status)) {
            session.range_support = RangeSupport::No;
            ++session.fallbacks;
            logger_->warn("Server did not support range requests for {} (HTTP {}), downloading it whole",
                          url, status);
            fetchFull(session, buffer);
            return;
        }

        throw TransferError(fmt::format("GET {} failed with HTTP {}", url, status), url, status);
    }
}

void RangeDownloader::fetchFull(TransferSession& session, TransferBuffer& buffer) {
    const std::string& url = session.resource.url;
    const std::uint64_t total = session.resource.total_bytes;
    unsigned failures = 0;

    while (true) {
        if (!buffer.empty() || session.downloaded_bytes > 0) {
            buffer.truncate();
            session.downloaded_bytes = 0;
            restartProgress(session);
        }

        BlockWriter writer{*this, session, buffer, BlockWriter::Mode::Full};
        long status = 0;
        try {
            ++session.requests;
            status = transport_.get(url, std::nullopt, writer);
        } catch (const TransientError& ex) {
            waitBeforeRetry(session, ex.what(), ++failures);
            continue;
        }

        if (!isSuccessStatus(status)) {
            throw TransferError(fmt::format("GET {} failed with HTTP {}", url, status), url, status);
        }

        if (total > 0 && session.downloaded_bytes < total) {
            waitBeforeRetry(session,
                            fmt::format("body ended after {} of {} bytes", session.downloaded_bytes, total),
                            ++failures);
            continue;
        }

        if (writer.discarded() > 0) {
            logger_->warn("{} sent {} bytes more than the {} it declared; the excess was dropped",
                          url, writer.discarded(), total);
        }
        return;
    }
}

void RangeDownloader::waitBeforeRetry(TransferSession& session, const std::string& reason, unsigned failures) {
    ++session.transient_failures;
    if (!options_.retry.allowsRetry(failures)) {
        logger_->error("Giving up on {} after {} consecutive failures: {}", session.resource.url, failures, reason);
        throw TransferError(fmt::format("Transfer of {} failed after {} attempts: {}",
                                        session.resource.url, failures, reason),
                            session.resource.url);
    }

    const auto delay = options_.retry.delayFor(failures);
    logger_->warn("Error occurred: {}. Retrying in {} ms", reason, delay.count());
    sleeper_(delay);
}

void RangeDownloader::restartProgress(const TransferSession& session) {
    progress_.end();
    progress_.begin(session.resource.total_bytes, session.resource.filename);
}

} // namespace streamdrop
