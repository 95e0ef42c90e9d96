#include "streamdrop/command_line.hpp"
#include "streamdrop/credentials.hpp"
#include "streamdrop/curl_transport.hpp"
#include "streamdrop/errors.hpp"
#include "streamdrop/links.hpp"
#include "streamdrop/logging.hpp"
#include "streamdrop/progress.hpp"
#include "streamdrop/range_downloader.hpp"
#include "streamdrop/upload_dispatcher.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

int main(int argc, char** argv) {
    auto logger = streamdrop::makeLogger();

    streamdrop::Options options;
    try {
        options = streamdrop::parseCommandLine(argc, argv);
    } catch (const streamdrop::ConfigError& ex) {
        std::cerr << ex.what() << '\n';
        streamdrop::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (options.show_help) {
        streamdrop::printUsage(std::cout, argv[0]);
        return 0;
    }
    if (options.verbose) {
        logger->set_level(spdlog::level::debug);
    }

    try {
        streamdrop::CredentialStore store{std::filesystem::current_path() / ".env"};
        const auto credentials = streamdrop::resolveCredentials(options, store);

        streamdrop::CurlOptions curl_options;
        curl_options.timeout = options.timeout;
        streamdrop::CurlTransport transport{curl_options};
        streamdrop::ConsoleProgress progress{std::cerr};
        streamdrop::UploadDispatcher uploader{transport, progress, logger};

        std::string filename;
        streamdrop::UploadResult result;
        if (streamdrop::isRemoteSource(options.source)) {
            streamdrop::RangeDownloader downloader{transport, progress, logger, options.download};
            auto download = downloader.download(options.source);
            filename = options.name.value_or(download.filename);
            result = uploader.upload(std::move(download.stream), filename, credentials);
        } else {
            const std::filesystem::path path{options.source};
            filename = options.name.value_or(path.filename().string());
            result = uploader.uploadFile(path, filename, credentials);
        }

        if (!result.success) {
            throw streamdrop::UploadError(result.message);
        }

        if (options.store_credential) {
            store.save(credentials);
            logger->info("Stored credentials in {}", store.file().string());
        }

        std::cout << streamdrop::formatLinks(result.id, filename) << std::flush;
    } catch (const streamdrop::LocalResourceError& ex) {
        logger->error("{} ({})", ex.what(), ex.path().string());
        return 1;
    } catch (const streamdrop::TransferError& ex) {
        logger->error("Download failed: {}", ex.what());
        return 1;
    } catch (const streamdrop::Error& ex) {
        logger->error("{}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        logger->critical("Fatal error: {}", ex.what());
        return 1;
    }
    return 0;
}
