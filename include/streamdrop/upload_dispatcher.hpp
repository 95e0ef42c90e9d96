#pragma once

#include "credentials.hpp"
#include "http_transport.hpp"
#include "progress.hpp"
#include "transfer_buffer.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace streamdrop {

inline constexpr const char* kUploadEndpoint = "https://pixeldrain.com/api/file";

struct UploadResult {
    bool success{false};
    std::string id;
    std::string message;
};

[[nodiscard]] UploadResult parseUploadResponse(const HttpResponse& response);

// Drops CR, LF and NUL so a server-supplied name cannot break out of the
// request header it is sent in.
[[nodiscard]] std::string sanitizeFilename(const std::string& filename);

class UploadDispatcher {
public:
    UploadDispatcher(HttpTransport& transport, ProgressTracker& progress,
                     std::shared_ptr<spdlog::logger> logger, std::string endpoint = kUploadEndpoint);

    // Consumes the stream; it cannot be read again afterwards.
    [[nodiscard]] UploadResult upload(ByteStream stream, const std::string& filename,
                                      const Credentials& credentials);

    // Fails with LocalResourceError before any request when the path is unusable.
    [[nodiscard]] UploadResult uploadFile(const std::filesystem::path& path, const std::string& filename,
                                          const Credentials& credentials);

private:
    UploadResult send(UploadRequest request);

    HttpTransport& transport_;
    ProgressTracker& progress_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string endpoint_;
};

} // namespace streamdrop
