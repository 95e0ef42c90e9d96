#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace streamdrop {

struct CurlOptions {
    // Connect timeout and stall limit for every request; a HEAD request must also
    // finish within it.
    std::chrono::seconds timeout{60};
    std::string user_agent{"streamdrop/0.1"};
    bool follow_redirects{true};
    bool verbose{false};
};

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlOptions options = {});
    ~CurlTransport() override;

    HttpResponse head(const std::string& url) override;
    long get(const std::string& url, const std::optional<ByteRange>& range,
             ResponseHandler& handler) override;
    HttpResponse post(const UploadRequest& request, ProgressTracker& progress) override;

private:
    // Keeps libcurl out of this header.
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamdrop
