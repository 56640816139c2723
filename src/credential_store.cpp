/**
 * @file credential_store.cpp
 * @brief File-backed credential storage for qwenchat
 */

#include "qwenchat/credential_store.hpp"
#include "qwenchat/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace qwenchat {

namespace fs = std::filesystem;

namespace {

std::string strip(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const std::string& path, const std::string& content) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw CredentialStoreError("Cannot create directory (" + ec.message() + ")", parent.string());
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw CredentialStoreError("Cannot open for writing", path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw CredentialStoreError("Write failed", path);
    }
}

} // namespace

TokenLookupChain& TokenLookupChain::add(const std::string& name, Lookup lookup) {
    lookups_.emplace_back(name, std::move(lookup));
    return *this;
}

std::optional<std::pair<std::string, std::string>> TokenLookupChain::resolve() const {
    for (const auto& [name, lookup] : lookups_) {
        std::optional<std::string> token = lookup();
        if (token.has_value() && !token->empty()) {
            return std::make_pair(name, *token);
        }
    }
    return std::nullopt;
}

CredentialStore::CredentialStore(
    const std::string& cookies_path,
    const std::string& token_path,
    const std::string& login_time_path
) : cookies_path_(cookies_path),
    token_path_(token_path),
    login_time_path_(login_time_path) {
}

std::optional<std::map<std::string, std::string>> CredentialStore::load_cookies() const {
    std::optional<std::string> content = read_file(cookies_path_);
    if (!content.has_value()) {
        return std::nullopt;
    }

    json data = json::parse(*content, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        spdlog::warn("Ignoring malformed cookie file {}", cookies_path_);
        return std::nullopt;
    }

    std::map<std::string, std::string> cookies;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (it.value().is_string()) {
            cookies[it.key()] = it.value().get<std::string>();
        }
    }
    return cookies;
}

std::optional<std::string> CredentialStore::load_token_file() const {
    std::optional<std::string> content = read_file(token_path_);
    if (!content.has_value()) {
        return std::nullopt;
    }
    std::string token = strip(*content);
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

std::optional<std::chrono::system_clock::time_point> CredentialStore::load_login_time() const {
    std::optional<std::string> content = read_file(login_time_path_);
    if (!content.has_value()) {
        return std::nullopt;
    }

    std::string value = strip(*content);
    try {
        return from_epoch_ms(std::stoll(value));
    } catch (const std::exception&) {
        spdlog::warn("Ignoring malformed login time in {}", login_time_path_);
        return std::nullopt;
    }
}

TokenLookupChain CredentialStore::token_chain(const std::map<std::string, std::string>& cookies) const {
    TokenLookupChain chain;
    chain.add("cookie", [&cookies]() -> std::optional<std::string> {
        auto it = cookies.find("token");
        if (it == cookies.end()) return std::nullopt;
        return it->second;
    });
    chain.add("token_file", [this]() { return load_token_file(); });
    return chain;
}

std::optional<Credentials> CredentialStore::load() const {
    std::optional<std::map<std::string, std::string>> cookies = load_cookies();
    if (!cookies.has_value()) {
        spdlog::debug("No stored cookies at {}", cookies_path_);
        return std::nullopt;
    }

    Credentials credentials;
    credentials.cookies = std::move(*cookies);
    credentials.issued_at = load_login_time();

    if (auto found = token_chain(credentials.cookies).resolve()) {
        spdlog::debug("Token found via {}", found->first);
        credentials.token = found->second;
    }

    return credentials;
}

void CredentialStore::save(const Credentials& credentials) const {
    json cookies = json::object();
    for (const auto& [name, value] : credentials.cookies) {
        cookies[name] = value;
    }
    write_file(cookies_path_, cookies.dump(2));

    // A token already held as the "token" cookie is found there first on load
    auto cookie_token = credentials.cookies.find("token");
    bool token_in_cookies = cookie_token != credentials.cookies.end()
        && credentials.token.has_value() && cookie_token->second == *credentials.token;

    if (credentials.token.has_value() && !token_in_cookies) {
        write_file(token_path_, *credentials.token);
    } else {
        std::error_code ec;
        fs::remove(token_path_, ec);
    }

    if (credentials.issued_at.has_value()) {
        write_file(login_time_path_, std::to_string(to_epoch_ms(*credentials.issued_at)));
    } else {
        std::error_code ec;
        fs::remove(login_time_path_, ec);
    }
}

void CredentialStore::clear() const {
    for (const std::string& path : {cookies_path_, token_path_, login_time_path_}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::warn("Could not remove {}: {}", path, ec.message());
        }
    }
}

} // namespace qwenchat
