#include "streamdrop/credentials.hpp"

#include "streamdrop/command_line.hpp"
#include "streamdrop/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <map>
#include <utility>

#include <fmt/format.h>

namespace streamdrop {

namespace {

std::string stripQuotes(std::string value) {
    while (!value.empty() && (value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

CredentialStore::CredentialStore(std::filesystem::path file) : file_(std::move(file)) {}

std::optional<Credentials> CredentialStore::load() const {
    std::ifstream in(file_);
    if (!in) {
        return std::nullopt;
    }

    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        values[line.substr(0, eq)] = stripQuotes(line.substr(eq + 1));
    }

    const auto username = values.find("username");
    const auto apikey = values.find("apikey");
    if (username == values.end() || apikey == values.end() ||
        username->second.empty() || apikey->second.empty()) {
        return std::nullopt;
    }
    return Credentials{username->second, apikey->second};
}

void CredentialStore::save(const Credentials& credentials) const {
    std::ofstream out(file_, std::ios::trunc);
    if (!out) {
        throw ConfigError(fmt::format("Cannot write credentials to {}", file_.string()));
    }
    out << "username=" << credentials.username << '\n';
    out << "apikey=" << credentials.apikey << '\n';
    out.flush();
    if (!out) {
        throw ConfigError(fmt::format("Cannot write credentials to {}", file_.string()));
    }
}

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

Credentials resolveCredentials(const Options& options, const CredentialStore& store,
                               const EnvironmentLookup& environment) {
    if (options.username && options.apikey) {
        return Credentials{*options.username, *options.apikey};
    }
    if (options.username || options.apikey) {
        throw ConfigError("You need to provide both username and apikey");
    }

    const auto env_user = environment("username");
    const auto env_key = environment("apikey");
    if (env_user && env_key) {
        return Credentials{*env_user, *env_key};
    }

    if (auto stored = store.load()) {
        return *stored;
    }
    throw ConfigError(fmt::format("Can't get username or apikey from previous credential ({})",
                                  store.file().string()));
}

} // namespace streamdrop
