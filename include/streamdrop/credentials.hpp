#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace streamdrop {

struct Options;

struct Credentials {
    std::string username;
    std::string apikey;
};

// Persists credentials as a small "key=value" dotenv file.
class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path file);

    [[nodiscard]] std::optional<Credentials> load() const;
    void save(const Credentials& credentials) const;

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    std::filesystem::path file_;
};

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnvironment(const std::string& name);

// Command line first, then the process environment, then the store.
[[nodiscard]] Credentials resolveCredentials(const Options& options, const CredentialStore& store,
                                             const EnvironmentLookup& environment = processEnvironment);

} // namespace streamdrop
