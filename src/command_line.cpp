#include "streamdrop/command_line.hpp"

#include "streamdrop/errors.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace streamdrop {

namespace {

constexpr long kMaxTimeoutSeconds = 24L * 60 * 60;
// long may be no wider than unsigned; clamp to what both can hold.
constexpr long kMaxRetries = static_cast<long>(
    std::min<unsigned long>(std::numeric_limits<unsigned>::max(), std::numeric_limits<long>::max()));

const char* requireValue(int argc, const char* const* argv, int& index, const std::string& option) {
    if (index + 1 >= argc) {
        throw ConfigError("Missing value for " + option);
    }
    return argv[++index];
}

long parseCount(const std::string& value, const std::string& option, long min_value, long max_value) {
    long parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError("Invalid value for " + option + ": " + value);
        }
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid value for " + option + ": " + value);
    }
    if (parsed < min_value || parsed > max_value) {
        throw ConfigError("Invalid value for " + option + ": " + value);
    }
    return parsed;
}

} // namespace

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name
        << " <url-or-path> [-n <name>] [-u <username>] [-k <apikey>] [--store-credential]"
        << std::endl;
    out << "Download a file to memory and upload it to pixeldrain without writing to disk.\n"
        << "Options:\n"
        << "  -n, --name <name>          Name for the uploaded file (default: server-provided name)\n"
        << "  -u, --username <username>  pixeldrain account user name\n"
        << "  -k, --apikey <apikey>      pixeldrain API key\n"
        << "      --store-credential     Save username and apikey to .env for later runs\n"
        << "      --timeout <seconds>    Per-request timeout (default: 60)\n"
        << "      --max-retries <n>      Give up after n consecutive failures (default: 0, never)\n"
        << "  -v, --verbose              Log debug output\n"
        << "  -h, --help                 Show this message" << std::endl;
}

Options parseCommandLine(int argc, const char* const* argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (arg == "-n" || arg == "--name") {
            options.name = requireValue(argc, argv, i, arg);
        } else if (arg == "-u" || arg == "--username") {
            options.username = requireValue(argc, argv, i, arg);
        } else if (arg == "-k" || arg == "--apikey") {
            options.apikey = requireValue(argc, argv, i, arg);
        } else if (arg == "--store-credential" || arg == "--store_credential") {
            options.store_credential = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--timeout") {
            options.timeout = std::chrono::seconds{parseCount(requireValue(argc, argv, i, arg), arg, 1, kMaxTimeoutSeconds)};
        } else if (arg == "--max-retries") {
            options.download.retry.max_attempts =
                static_cast<unsigned>(parseCount(requireValue(argc, argv, i, arg), arg, 0, kMaxRetries));
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ConfigError("Unknown option: " + arg);
        } else if (options.source.empty()) {
            options.source = arg;
        } else {
            throw ConfigError("Unexpected argument: " + arg);
        }
    }

    if (options.source.empty()) {
        throw ConfigError("Missing source URL or path");
    }
    return options;
}

bool isRemoteSource(const std::string& source) {
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

} // namespace streamdrop
