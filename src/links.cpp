#include "streamdrop/links.hpp"

#include <fmt/format.h>

namespace streamdrop {

std::string viewLink(const std::string& id) {
    return fmt::format("https://pixeldrain.com/u/{}", id);
}

std::string downloadLink(const std::string& id) {
    return fmt::format("https://pixeldrain.com/api/file/{}?download", id);
}

std::string formatLinks(const std::string& id, const std::string& filename) {
    return fmt::format("Uploaded {}\n  View:     {}\n  Download: {}\n", filename, viewLink(id), downloadLink(id));
}

} // namespace streamdrop
