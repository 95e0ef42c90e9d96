#pragma once

#include "http_transport.hpp"

#include <cstdint>
#include <string>

namespace streamdrop {

inline constexpr const char* kDefaultFilename = "Unnamed";

struct ResourceDescriptor {
    std::string url;
    std::uint64_t total_bytes{0};   // 0 when the server did not say
    std::string filename{kDefaultFilename};
};

[[nodiscard]] std::uint64_t parseContentLength(const Headers& headers);
[[nodiscard]] std::string parseFilename(const Headers& headers);
[[nodiscard]] ResourceDescriptor describeResource(const std::string& url, const HttpResponse& head_response);

} // namespace streamdrop
