#pragma once

#include "range_downloader.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>

namespace streamdrop {

struct Options {
    std::string source;
    std::optional<std::string> name;
    std::optional<std::string> username;
    std::optional<std::string> apikey;
    bool store_credential{false};
    bool verbose{false};
    bool show_help{false};
    std::chrono::seconds timeout{60};
    DownloadOptions download{};
};

[[nodiscard]] Options parseCommandLine(int argc, const char* const* argv);
void printUsage(std::ostream& out, const char* program_name);

[[nodiscard]] bool isRemoteSource(const std::string& source);

} // namespace streamdrop
