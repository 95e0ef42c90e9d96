#pragma once

#include <string>

namespace streamdrop {

std::string viewLink(const std::string& id);
std::string downloadLink(const std::string& id);
std::string formatLinks(const std::string& id, const std::string& filename);

} // namespace streamdrop
