#include "token_manager.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

namespace capi_pipeline {

namespace {

// How often a caller queued behind an in-flight refresh re-checks its token.
constexpr auto kRefreshLockPoll = std::chrono::milliseconds(20);

std::string joinScopes(const std::vector<std::string>& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) out.push_back(' ');
        out += s;
    }
    return out;
}

std::string stringField(const nlohmann::json& body, const char* key,
                        const std::string& fallback = std::string()) {
    auto it = body.find(key);
    return it != body.end() && it->is_string() ? it->get<std::string>() : fallback;
}

} // namespace

// ---------------------------------------------------------------------------
// Token / TokenStore
// ---------------------------------------------------------------------------

bool Token::valid() const {
    if (accessToken.empty()) return false;
    if (!expiresAt) return true;
    return SystemClock::now() + kExpirySkew < *expiresAt;
}

std::optional<Token> TokenStore::get() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mToken;
}

void TokenStore::set(Token token) {
    std::lock_guard<std::mutex> lock(mMutex);
    mToken = std::move(token);
}

void TokenStore::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mToken.reset();
}

// ---------------------------------------------------------------------------
// Grant selection
// ---------------------------------------------------------------------------

const char* grantTypeName(GrantType grant) {
    switch (grant) {
        case GrantType::None:              return "none";
        case GrantType::StaticOnly:        return "static";
        case GrantType::PasswordFallback:  return "password_fallback";
        case GrantType::ClientCredentials: return "client_credentials";
        case GrantType::Password:          return "password";
        case GrantType::RefreshToken:      return "refresh_token";
    }
    return "unknown";
}

GrantType selectGrant(const Credentials& creds, const std::string& storedRefreshToken) {
    const bool hasPassword = !creds.username.empty() && !creds.password.empty();

    if (!creds.accessToken.empty() && hasPassword) {
        return GrantType::PasswordFallback;
    }
    if (!creds.clientId.empty() && !creds.clientSecret.empty()) {
        return GrantType::ClientCredentials;
    }
    if (hasPassword) {
        return GrantType::Password;
    }
    if (!storedRefreshToken.empty() || !creds.refreshToken.empty()) {
        return GrantType::RefreshToken;
    }
    if (!creds.accessToken.empty()) {
        return GrantType::StaticOnly;
    }
    return GrantType::None;
}

// ---------------------------------------------------------------------------
// OAuth2TokenManager
// ---------------------------------------------------------------------------

OAuth2TokenManager::OAuth2TokenManager(Credentials creds,
                                       HttpTransport& transport,
                                       std::shared_ptr<Logger> logger)
    : mCreds(std::move(creds))
    , mTransport(transport)
    , mLogger(logger ? std::move(logger) : std::make_shared<NullLogger>())
{
    if (!mCreds.accessToken.empty()) {
        Token initial;
        initial.accessToken  = mCreds.accessToken;
        initial.refreshToken = mCreds.refreshToken;
        initial.expiresAt    = mCreds.accessTokenExpiry;
        mStore.set(std::move(initial));
    }
}

std::string OAuth2TokenManager::getToken(const CancelToken& cancel) {
    if (mCreds.noAuth) return "";

    if (auto current = mStore.get(); current && current->valid()) {
        return current->accessToken;
    }

    auto lock = lockRefresh(cancel);

    // Another caller may have refreshed while we waited for the lock.
    if (auto current = mStore.get(); current && current->valid()) {
        return current->accessToken;
    }
    return obtainToken(cancel).accessToken;
}

void OAuth2TokenManager::refreshToken(const CancelToken& cancel) {
    const uint64_t seen = mGeneration.load();

    auto lock = lockRefresh(cancel);
    if (mGeneration.load() != seen) {
        return;   // a refresh completed while we were queued; share it
    }
    obtainToken(cancel);
}

void OAuth2TokenManager::setToken(const std::string& accessToken,
                                  SystemClock::time_point expiresAt) {
    Token token;
    token.accessToken = accessToken;
    token.expiresAt   = expiresAt;
    mStore.set(std::move(token));
    ++mGeneration;
}

void OAuth2TokenManager::setRefreshListener(std::function<void(const Token&)> listener) {
    std::lock_guard<std::mutex> lock(mListenerMutex);
    mListener = std::move(listener);
}

bool OAuth2TokenManager::isTokenExpiringSoon(std::chrono::seconds within) const {
    const auto current = mStore.get();
    if (!current) return true;
    if (!current->expiresAt) return false;
    return SystemClock::now() + within > *current->expiresAt;
}

std::optional<SystemClock::time_point> OAuth2TokenManager::tokenExpiry() const {
    const auto current = mStore.get();
    if (!current) return std::nullopt;
    return current->expiresAt;
}

std::unique_lock<std::timed_mutex>
OAuth2TokenManager::lockRefresh(const CancelToken& cancel) {
    std::unique_lock<std::timed_mutex> lock(mRefreshMutex, std::defer_lock);
    while (!lock.try_lock_for(kRefreshLockPoll)) {
        cancel.throwIfCancelled();
    }
    return lock;
}

Token OAuth2TokenManager::obtainToken(const CancelToken& cancel) {
    const auto current     = mStore.get();
    const auto storedRefresh = current ? current->refreshToken : std::string();
    const auto grant       = selectGrant(mCreds, storedRefresh);
    const auto scope       = joinScopes(mCreds.scopes);

    std::vector<std::pair<std::string, std::string>> fields;
    Token token;

    switch (grant) {
        case GrantType::None:
            throw AuthenticationError("no valid credentials available");

        case GrantType::StaticOnly:
            throw AuthenticationError("static token cannot be refreshed");

        case GrantType::ClientCredentials:
            fields.emplace_back("grant_type", "client_credentials");
            if (!scope.empty()) fields.emplace_back("scope", scope);
            token = postGrant("client_credentials", std::move(fields),
                              mCreds.clientId, mCreds.clientSecret, cancel);
            break;

        case GrantType::PasswordFallback:
        case GrantType::Password:
            fields.emplace_back("grant_type", "password");
            fields.emplace_back("username", mCreds.username);
            fields.emplace_back("password", mCreds.password);
            if (!scope.empty()) fields.emplace_back("scope", scope);
            token = postGrant("password", std::move(fields),
                              mCreds.clientId.empty() ? kDefaultClientId : mCreds.clientId,
                              mCreds.clientId.empty() ? "" : mCreds.clientSecret,
                              cancel);
            break;

        case GrantType::RefreshToken:
            fields.emplace_back("grant_type", "refresh_token");
            fields.emplace_back("refresh_token",
                                storedRefresh.empty() ? mCreds.refreshToken : storedRefresh);
            token = postGrant("refresh_token", std::move(fields),
                              mCreds.clientId.empty() ? kDefaultClientId : mCreds.clientId,
                              mCreds.clientId.empty() ? "" : mCreds.clientSecret,
                              cancel);
            // Some servers rotate refresh tokens, some don't.
            if (token.refreshToken.empty()) {
                token.refreshToken = storedRefresh.empty() ? mCreds.refreshToken : storedRefresh;
            }
            break;
    }

    if (token.refreshToken.empty() && current) {
        token.refreshToken = current->refreshToken;
    }

    storeNewToken(token, grant);
    return token;
}

Token OAuth2TokenManager::postGrant(const std::string& grantName,
                                    std::vector<std::pair<std::string, std::string>> fields,
                                    const std::string& basicUser,
                                    const std::string& basicPassword,
                                    const CancelToken& cancel)
{
    if (mCreds.tokenUrl.empty()) {
        throw AuthenticationError("no token endpoint configured for " + grantName + " grant");
    }

    HttpRequest request;
    request.method = "POST";
    request.url    = mCreds.tokenUrl;
    request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    request.headers["Accept"]       = "application/json";
    request.headers["Authorization"] =
        "Basic " + base64Encode(basicUser + ":" + basicPassword);
    request.body = formEncode(fields);

    mLogger->debug("Token request", {{"grant_type", grantName}, {"url", mCreds.tokenUrl}});

    ++mExchanges;
    const auto response   = mTransport.send(request, cancel);
    const auto receivedAt = SystemClock::now();

    const auto body = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);

    if (response.status < 200 || response.status >= 300) {
        std::string upstreamError;
        std::string upstreamDescription;
        if (body.is_object()) {
            upstreamError       = stringField(body, "error");
            upstreamDescription = stringField(body, "error_description");
        }

        std::string message = "token request failed (HTTP " +
                              std::to_string(response.status) + ")";
        if (!upstreamError.empty() || !upstreamDescription.empty()) {
            message += ": " + upstreamError + ": " + upstreamDescription;
        } else if (!response.body.empty()) {
            message += ": " + response.body;
        }

        mLogger->error("Token request failed",
                       {{"grant_type", grantName},
                        {"status", std::to_string(response.status)},
                        {"error", upstreamError}});
        throw AuthenticationError(message, upstreamError, upstreamDescription,
                                  response.status);
    }

    if (!body.is_object() || !body.contains("access_token") ||
        !body["access_token"].is_string()) {
        throw AuthenticationError("token response missing access_token");
    }

    Token token;
    token.accessToken  = body["access_token"].get<std::string>();
    token.refreshToken = stringField(body, "refresh_token");
    token.tokenType    = stringField(body, "token_type", "bearer");
    if (body.contains("expires_in") && body["expires_in"].is_number()) {
        token.expiresAt = receivedAt +
            std::chrono::seconds(body["expires_in"].get<int64_t>());
    }
    return token;
}

void OAuth2TokenManager::storeNewToken(Token token, GrantType grant) {
    mStore.set(token);
    ++mGeneration;

    mLogger->info("Token refreshed", {{"grant_type", grantTypeName(grant)}});

    std::function<void(const Token&)> listener;
    {
        std::lock_guard<std::mutex> lock(mListenerMutex);
        listener = mListener;
    }
    if (listener) listener(token);
}

// ---------------------------------------------------------------------------
// UAA helpers
// ---------------------------------------------------------------------------

std::string uaaTokenUrl(const std::string& uaaUrl) {
    return joinUrl(uaaUrl, "/oauth/token");
}

std::unique_ptr<OAuth2TokenManager>
makeUaaTokenManager(const std::string& uaaUrl,
                    const std::string& clientId,
                    const std::string& clientSecret,
                    HttpTransport& transport,
                    std::shared_ptr<Logger> logger)
{
    Credentials creds;
    creds.tokenUrl     = uaaTokenUrl(uaaUrl);
    creds.clientId     = clientId;
    creds.clientSecret = clientSecret;
    creds.scopes       = {"cloud_controller.read", "cloud_controller.write"};
    return std::make_unique<OAuth2TokenManager>(std::move(creds), transport,
                                                std::move(logger));
}

} // namespace capi_pipeline
