#pragma once

#include "progress.hpp"
#include "transfer_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace streamdrop {

// Header names are stored lower-cased.
using Headers = std::map<std::string, std::string>;

[[nodiscard]] std::optional<std::string> findHeader(const Headers& headers, const std::string& name);

// First byte offset of a "Content-Range: bytes first-last/total" header, or
// nullopt when the header is absent or not a byte range.
[[nodiscard]] std::optional<std::uint64_t> contentRangeStart(const Headers& headers);

struct HttpResponse {
    long status{0};
    Headers headers;
    std::string body;

    [[nodiscard]] bool isSuccess() const { return status >= 200 && status < 300; }
};

// Inclusive byte range, as written in a "Range: bytes=first-last" header.
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

// Receives a GET response. onStatus() is called exactly once, with the final
// response's headers and before any body bytes; returning false stops the
// transfer without raising an error.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    virtual bool onStatus(long status, const Headers& headers) = 0;
    virtual void onData(const char* data, std::size_t size) = 0;
};

struct UploadRequest {
    std::string url;
    std::string username;
    std::string password;
    Headers headers;
    std::string field_name{"file"};
    std::string filename;
    std::uint64_t size{0};

    // Exactly one of these names the content.
    ByteStream* stream{nullptr};
    std::filesystem::path path;
};

// Blocking HTTP client used by the download engine and the upload dispatcher.
// Network-layer failures are thrown as TransientError; HTTP error statuses are
// returned to the caller untouched.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse head(const std::string& url) = 0;
    virtual long get(const std::string& url, const std::optional<ByteRange>& range,
                     ResponseHandler& handler) = 0;
    virtual HttpResponse post(const UploadRequest& request, ProgressTracker& progress) = 0;
};

} // namespace streamdrop
