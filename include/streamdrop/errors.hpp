#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace streamdrop {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Network-layer failure (reset, timeout, name resolution). The download engine
// retries these at the last confirmed offset.
class TransientError : public Error {
public:
    using Error::Error;
};

// Unrecoverable transfer failure: a 4xx/5xx status, a malformed response or an
// exhausted retry budget. status() is 0 when no HTTP status was involved.
class TransferError : public Error {
public:
    TransferError(const std::string& message, std::string url, long status = 0)
        : Error(message), url_(std::move(url)), status_(status) {}

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] long status() const noexcept { return status_; }

private:
    std::string url_;
    long status_;
};

class LocalResourceError : public Error {
public:
    LocalResourceError(const std::string& message, std::filesystem::path path)
        : Error(message), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class UploadError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace streamdrop
