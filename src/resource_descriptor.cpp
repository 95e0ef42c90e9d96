#include "streamdrop/resource_descriptor.hpp"

#include <cctype>
#include <charconv>

namespace streamdrop {

namespace {

std::string trim(const std::string& value, const char* extra = "") {
    const std::string extras{extra};
    const auto strip = [&extras](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || extras.find(c) != std::string::npos;
    };

    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && strip(value[begin])) {
        ++begin;
    }
    while (end > begin && strip(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

} // namespace

std::uint64_t parseContentLength(const Headers& headers) {
    const auto value = findHeader(headers, "Content-Length");
    if (!value) {
        return 0;
    }

    const std::string digits = trim(*value);
    std::uint64_t length = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
    if (ec != std::errc{} || end != digits.data() + digits.size()) {
        return 0;
    }
    return length;
}

std::string parseFilename(const Headers& headers) {
    const auto disposition = findHeader(headers, "Content-Disposition");
    if (!disposition) {
        return kDefaultFilename;
    }

    const std::string marker = "filename=";
    const auto pos = disposition->find(marker);
    if (pos == std::string::npos) {
        return kDefaultFilename;
    }

    std::string name = disposition->substr(pos + marker.size());
    const auto separator = name.find(';');
    if (separator != std::string::npos) {
        name.erase(separator);
    }
    name = trim(name, "\"");
    return name.empty() ? std::string{kDefaultFilename} : name;
}

ResourceDescriptor describeResource(const std::string& url, const HttpResponse& head_response) {
    return ResourceDescriptor{url, parseContentLength(head_response.headers), parseFilename(head_response.headers)};
}

} // namespace streamdrop
