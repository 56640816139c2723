/**
 * @file credential_store.hpp
 * @brief Persisted cookies, token and login time for qwenchat
 */

#ifndef QWENCHAT_CREDENTIAL_STORE_HPP
#define QWENCHAT_CREDENTIAL_STORE_HPP

#include "types.hpp"
#include <utility>

namespace qwenchat {

/**
 * Prioritized token lookup strategies, tried in order until one yields a value
 */
class TokenLookupChain {
public:
    using Lookup = std::function<std::optional<std::string>()>;

    /**
     * Append a strategy
     * @param name Strategy name, reported by resolve()
     * @param lookup Strategy returning a token or nullopt
     * @return This chain
     */
    TokenLookupChain& add(const std::string& name, Lookup lookup);

    /**
     * Run the strategies in order
     * @return Strategy name and token of the first non-empty result
     */
    std::optional<std::pair<std::string, std::string>> resolve() const;

    std::size_t size() const { return lookups_.size(); }

private:
    std::vector<std::pair<std::string, Lookup>> lookups_;
};

/**
 * File-backed credential store
 *
 * Cookies live in a JSON object file, the token in a plain-text file and the
 * last login time as epoch milliseconds in a third file.
 */
class CredentialStore {
public:
    CredentialStore(
        const std::string& cookies_path,
        const std::string& token_path,
        const std::string& login_time_path
    );

    /**
     * Load persisted credentials
     * @return Credentials, or nullopt when no cookie file could be read
     */
    std::optional<Credentials> load() const;

    /**
     * Persist credentials
     *
     * The token file is skipped when the token equals the "token" cookie.
     * On load the cookie wins, so a token that differs from a "token" cookie,
     * or an unset token beside one, does not survive a round trip.
     * @param credentials Credentials to write
     * @throws CredentialStoreError when a file cannot be written
     */
    void save(const Credentials& credentials) const;

    /**
     * Remove all persisted files
     */
    void clear() const;

    const std::string& cookies_path() const { return cookies_path_; }
    const std::string& token_path() const { return token_path_; }
    const std::string& login_time_path() const { return login_time_path_; }

private:
    std::optional<std::map<std::string, std::string>> load_cookies() const;
    std::optional<std::string> load_token_file() const;
    std::optional<std::chrono::system_clock::time_point> load_login_time() const;
    TokenLookupChain token_chain(const std::map<std::string, std::string>& cookies) const;

    std::string cookies_path_;
    std::string token_path_;
    std::string login_time_path_;
};

} // namespace qwenchat

#endif // QWENCHAT_CREDENTIAL_STORE_HPP
