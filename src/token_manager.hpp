#pragma once

#include "cancellation.hpp"
#include "http_transport.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace capi_pipeline {

using SystemClock = std::chrono::system_clock;

/// Bearer token as returned by the token endpoint.
struct Token {
    /// Tokens this close to expiry are treated as already expired.
    static constexpr std::chrono::seconds kExpirySkew{30};

    std::string accessToken;
    std::string refreshToken;
    std::string tokenType = "bearer";
    std::optional<SystemClock::time_point> expiresAt;   // nullopt: never expires

    bool valid() const;
};

/// Thread-safe holder for the current token.  Tokens are replaced
/// wholesale, never edited in place.
class TokenStore {
public:
    std::optional<Token> get() const;
    void set(Token token);
    void clear();

private:
    mutable std::mutex   mMutex;
    std::optional<Token> mToken;
};

/// Credential material.  Which grant is used follows a fixed precedence,
/// see selectGrant().
struct Credentials {
    std::string tokenUrl;
    std::string clientId;
    std::string clientSecret;
    std::string username;
    std::string password;
    std::string refreshToken;
    std::string accessToken;                                   // static token
    std::optional<SystemClock::time_point> accessTokenExpiry;  // of the static token
    std::vector<std::string> scopes;
    bool noAuth = false;   // explicitly send requests without Authorization
};

enum class GrantType {
    None,
    StaticOnly,          // static token, nothing to refresh it with
    PasswordFallback,    // static token backed by username/password
    ClientCredentials,
    Password,
    RefreshToken,
};

const char* grantTypeName(GrantType grant);

/// Grant used when a new token is needed.  @p storedRefreshToken is the
/// refresh token held from a previous exchange, if any.
GrantType selectGrant(const Credentials& creds, const std::string& storedRefreshToken);

/// Client id used for password and refresh grants when none is configured.
constexpr const char* kDefaultClientId = "cf";

class TokenManager {
public:
    virtual ~TokenManager() = default;

    /// Current bearer token, obtaining a new one when needed.
    /// Throws AuthenticationError, TransportError or CancelledError.
    virtual std::string getToken(const CancelToken& cancel) = 0;

    /// Force a new grant exchange.
    virtual void refreshToken(const CancelToken& cancel) = 0;

    /// Inject a token directly.
    virtual void setToken(const std::string& accessToken,
                          SystemClock::time_point expiresAt) = 0;
};

/// OAuth2 token manager talking form-encoded grants to a token endpoint.
///
/// Concurrent callers that find the token expired are serialized on a
/// refresh lock; whoever gets it first performs the exchange and the rest
/// reuse the result, so one expired window costs one exchange.
class OAuth2TokenManager : public TokenManager {
public:
    OAuth2TokenManager(Credentials creds,
                       HttpTransport& transport,
                       std::shared_ptr<Logger> logger = nullptr);

    std::string getToken(const CancelToken& cancel) override;
    void refreshToken(const CancelToken& cancel) override;
    void setToken(const std::string& accessToken,
                  SystemClock::time_point expiresAt) override;

    /// Called inline with every token obtained from the endpoint, e.g. to
    /// persist it.
    void setRefreshListener(std::function<void(const Token&)> listener);

    std::optional<Token> currentToken() const { return mStore.get(); }

    /// True when there is no token or it expires within @p within.
    bool isTokenExpiringSoon(std::chrono::seconds within) const;

    std::optional<SystemClock::time_point> tokenExpiry() const;

    const Credentials& credentials() const { return mCreds; }

    /// Number of grant exchanges performed so far.
    std::size_t exchangeCount() const { return mExchanges.load(); }

private:
    Credentials             mCreds;
    HttpTransport&          mTransport;
    std::shared_ptr<Logger> mLogger;
    TokenStore              mStore;

    std::timed_mutex        mRefreshMutex;
    std::atomic<uint64_t>   mGeneration{0};
    std::atomic<std::size_t> mExchanges{0};

    std::mutex                         mListenerMutex;
    std::function<void(const Token&)>  mListener;

    std::unique_lock<std::timed_mutex> lockRefresh(const CancelToken& cancel);

    Token obtainToken(const CancelToken& cancel);

    Token postGrant(const std::string& grantName,
                    std::vector<std::pair<std::string, std::string>> fields,
                    const std::string& basicUser,
                    const std::string& basicPassword,
                    const CancelToken& cancel);

    void storeNewToken(Token token, GrantType grant);
};

/// "<uaa>/oauth/token", tolerating a trailing slash on @p uaaUrl.
std::string uaaTokenUrl(const std::string& uaaUrl);

/// Client-credentials manager against a UAA with the Cloud Controller
/// read/write scopes.
std::unique_ptr<OAuth2TokenManager>
makeUaaTokenManager(const std::string& uaaUrl,
                    const std::string& clientId,
                    const std::string& clientSecret,
                    HttpTransport& transport,
                    std::shared_ptr<Logger> logger = nullptr);

} // namespace capi_pipeline
