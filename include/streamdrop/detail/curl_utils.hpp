#pragma once

#include <curl/curl.h>

#include <memory>

namespace streamdrop::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlHeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct MimeDeleter {
    void operator()(curl_mime* mime) const noexcept { curl_mime_free(mime); }
};
using CurlMime = std::unique_ptr<curl_mime, MimeDeleter>;

void ensureCurlInitialized();

CurlHandle makeCurlHandle();

// Failures worth retrying at the same offset: the peer or the path between us
// went away, as opposed to a request we built wrong.
bool isTransientCurlError(CURLcode code) noexcept;

} // namespace streamdrop::detail
