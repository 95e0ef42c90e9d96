#include "streamdrop/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace streamdrop {

std::optional<std::string> findHeader(const Headers& headers, const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> contentRangeStart(const Headers& headers) {
    const auto value = findHeader(headers, "Content-Range");
    if (!value) {
        return std::nullopt;
    }

    const std::string unit = "bytes ";
    const auto pos = value->find(unit);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    const char* first = value->data() + pos + unit.size();
    const char* last = value->data() + value->size();
    while (first < last && *first == ' ') {
        ++first;
    }
    std::uint64_t start = 0;
    const auto [end, ec] = std::from_chars(first, last, start);
    if (ec != std::errc{} || end == last || *end != '-') {
        return std::nullopt;
    }
    return start;
}

} // namespace streamdrop
