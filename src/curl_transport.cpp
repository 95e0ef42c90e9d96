#include "streamdrop/curl_transport.hpp"

#include "streamdrop/detail/curl_utils.hpp"
#include "streamdrop/errors.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace streamdrop {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimLine(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    return value.substr(start);
}

[[noreturn]] void raiseCurlError(CURLcode code, const std::string& url, const char* error_buffer) {
    const std::string reason = (error_buffer && error_buffer[0] != '\0') ? error_buffer : curl_easy_strerror(code);
    const std::string message = fmt::format("{}: {}", url, reason);
    if (detail::isTransientCurlError(code)) {
        throw TransientError(message);
    }
    throw TransferError(message, url);
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(CurlOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    HttpResponse head(const std::string& url) {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url);

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            raiseCurlError(res, url, error_buffer_);
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    long get(const std::string& url, const std::optional<ByteRange>& range, ResponseHandler& handler) {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url);

        std::string range_spec;
        if (range) {
            range_spec = fmt::format("{}-{}", range->first, range->last);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range_spec.c_str());
        }

        // No data for a whole timeout period counts as a dropped connection.
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.timeout.count()));

        BodyContext ctx{curl.get(), &handler};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx.headers);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::bodyCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (res == CURLE_WRITE_ERROR && ctx.declined) {
            return ctx.status;
        }
        if (res != CURLE_OK) {
            raiseCurlError(res, url, error_buffer_);
        }

        if (!ctx.status_reported) {
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.status);
            handler.onStatus(ctx.status, ctx.headers);
        }
        return ctx.status;
    }

    HttpResponse post(const UploadRequest& request, ProgressTracker& progress) {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), request.url);

        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, request.username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, request.password.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.timeout.count()));

        detail::CurlHeaderList headers;
        for (const auto& [name, value] : request.headers) {
            const std::string line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
            if (!appended) {
                throw TransferError("Failed to build request headers", request.url);
            }
            headers.release();
            headers.reset(appended);
        }
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

        detail::CurlMime mime{curl_mime_init(curl.get())};
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, request.field_name.c_str());
        curl_mime_filename(part, request.filename.c_str());
        curl_mime_type(part, "application/octet-stream");
        if (request.stream) {
            curl_mime_data_cb(part, static_cast<curl_off_t>(request.stream->remaining()),
                              &Impl::streamReadCallback, nullptr, nullptr, request.stream);
        } else if (curl_mime_filedata(part, request.path.string().c_str()) != CURLE_OK) {
            throw LocalResourceError(fmt::format("Cannot read {}", request.path.string()), request.path);
        }
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

        UploadProgressContext progress_ctx{&progress, 0};
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::uploadProgressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress_ctx);

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
                if (!out) {
                    return 0;
                }
                out->append(ptr, size * nmemb);
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            raiseCurlError(res, request.url, error_buffer_);
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

private:
    struct BodyContext {
        CURL* curl{nullptr};
        ResponseHandler* handler{nullptr};
        Headers headers;
        long status{0};
        bool status_reported{false};
        bool declined{false};
        std::exception_ptr failure;
    };

    struct UploadProgressContext {
        ProgressTracker* progress{nullptr};
        curl_off_t reported{0};
    };

    void applyCommonOptions(CURL* curl, const std::string& url) {
        error_buffer_[0] = '\0';
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_VERBOSE, options_.verbose ? 1L : 0L);
    }

    // Keeps only the headers of the last response, so redirects do not leak
    // their Content-Length into the result.
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* headers = static_cast<Headers*>(userdata);
        const size_t total = size * nitems;
        if (!headers) {
            return 0;
        }

        const std::string line(buffer, total);
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return total;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            (*headers)[lowercase(trimLine(line.substr(0, colon)))] = trimLine(line.substr(colon + 1));
        }
        return total;
    }

    static size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<BodyContext*>(userdata);
        if (!ctx || !ctx->handler) {
            return 0;
        }

        const size_t total = size * nmemb;
        try {
            if (!ctx->status_reported) {
                curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
                ctx->status_reported = true;
                if (!ctx->handler->onStatus(ctx->status, ctx->headers)) {
                    ctx->declined = true;
                    return 0;
                }
            }
            ctx->handler->onData(ptr, total);
        } catch (...) {
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    static size_t streamReadCallback(char* buffer, size_t size, size_t nitems, void* arg) {
        auto* stream = static_cast<ByteStream*>(arg);
        if (!stream) {
            return CURL_READFUNC_ABORT;
        }
        return stream->read(buffer, size * nitems);
    }

    static int uploadProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
        auto* ctx = static_cast<UploadProgressContext*>(clientp);
        if (ctx && ctx->progress && ulnow > ctx->reported) {
            ctx->progress->advance(static_cast<std::uint64_t>(ulnow - ctx->reported));
            ctx->reported = ulnow;
        }
        return 0;
    }

    CurlOptions options_;
    char error_buffer_[CURL_ERROR_SIZE]{};
};

CurlTransport::CurlTransport(CurlOptions options) : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::head(const std::string& url) { return impl_->head(url); }

long CurlTransport::get(const std::string& url, const std::optional<ByteRange>& range, ResponseHandler& handler) {
    return impl_->get(url, range, handler);
}

HttpResponse CurlTransport::post(const UploadRequest& request, ProgressTracker& progress) {
    return impl_->post(request, progress);
}

} // namespace streamdrop
