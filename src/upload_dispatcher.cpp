#include "streamdrop/upload_dispatcher.hpp"

#include "streamdrop/errors.hpp"
#include "streamdrop/resource_descriptor.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace streamdrop {

std::string sanitizeFilename(const std::string& filename) {
    std::string clean;
    clean.reserve(filename.size());
    for (const char c : filename) {
        if (c != '\r' && c != '\n' && c != '\0') {
            clean.push_back(c);
        }
    }
    return clean.empty() ? std::string{kDefaultFilename} : clean;
}

UploadResult parseUploadResponse(const HttpResponse& response) {
    const auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return UploadResult{false, "", fmt::format("Unexpected response from upload server (HTTP {})", response.status)};
    }

    UploadResult result;
    result.success = json.value("success", false) && response.isSuccess();
    if (result.success) {
        result.id = json.value("id", std::string{});
        if (result.id.empty()) {
            result.success = false;
            result.message = "Upload server did not return a file id";
        }
        return result;
    }

    result.message = json.value("message", json.value("value", std::string{}));
    if (result.message.empty()) {
        result.message = fmt::format("Upload rejected (HTTP {})", response.status);
    }
    return result;
}

UploadDispatcher::UploadDispatcher(HttpTransport& transport, ProgressTracker& progress,
                                   std::shared_ptr<spdlog::logger> logger, std::string endpoint)
    : transport_(transport), progress_(progress), logger_(std::move(logger)), endpoint_(std::move(endpoint)) {}

UploadResult UploadDispatcher::upload(ByteStream stream, const std::string& filename,
                                      const Credentials& credentials) {
    UploadRequest request;
    request.url = endpoint_;
    request.username = credentials.username;
    request.password = credentials.apikey;
    request.filename = sanitizeFilename(filename);
    request.headers["name"] = request.filename;
    request.size = stream.remaining();
    request.stream = &stream;
    return send(std::move(request));
}

UploadResult UploadDispatcher::uploadFile(const std::filesystem::path& path, const std::string& filename,
                                          const Credentials& credentials) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw LocalResourceError(fmt::format("File not found: {}", path.string()), path);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw LocalResourceError(fmt::format("Not a regular file: {}", path.string()), path);
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || !std::ifstream(path, std::ios::binary)) {
        throw LocalResourceError(fmt::format("Cannot read {}", path.string()), path);
    }

    UploadRequest request;
    request.url = endpoint_;
    request.username = credentials.username;
    request.password = credentials.apikey;
    request.filename = sanitizeFilename(filename);
    request.headers["name"] = request.filename;
    request.size = size;
    request.path = path;
    return send(std::move(request));
}

UploadResult UploadDispatcher::send(UploadRequest request) {
    logger_->info("Start uploading {} ({} bytes) to {}", request.filename, request.size, request.url);

    HttpResponse response;
    progress_.begin(request.size, request.filename);
    try {
        response = transport_.post(request, progress_);
    } catch (const TransientError& ex) {
        progress_.end();
        throw UploadError(fmt::format("Upload of {} failed: {}", request.filename, ex.what()));
    } catch (const TransferError& ex) {
        progress_.end();
        throw UploadError(fmt::format("Upload of {} failed: {}", request.filename, ex.what()));
    }
    progress_.end();

    logger_->debug("Upload server answered HTTP {}: {}", response.status, response.body);
    auto result = parseUploadResponse(response);
    if (result.success) {
        logger_->info("Done uploading {} as {}", request.filename, result.id);
    } else {
        logger_->error("Upload of {} failed: {}", request.filename, result.message);
    }
    return result;
}

} // namespace streamdrop
