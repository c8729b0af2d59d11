#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "json.hpp"
#include "state_storage.hpp"
#include "utils.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "cppcoro/task.hpp"
#include <spdlog/spdlog.h>

using IdGenerator = std::function<std::string()>;

/**
 * \brief Inbound request bound to the redirect route, and the response it produces.
 */
class RequestContext {
public:
    virtual ~RequestContext() = default;

    // Empty string when the parameter is missing
    [[nodiscard]] virtual std::string query(const std::string &name) const = 0;

    virtual void redirect(const std::string &location, int status) = 0;
};

enum class AuthPhase {
    LoggedOut,
    AwaitingCallback,
    ExchangingCode,
    LoggedIn,
};

enum class SilentSso {
    TokenValid,
    Refreshed,
    RefreshFailed,
    Unavailable,
};

// The caller may proceed without an interactive login
[[nodiscard]] constexpr bool sso_available(const SilentSso result) {
    return result != SilentSso::Unavailable;
}

// A valid access token is held after the attempt
[[nodiscard]] constexpr bool sso_authenticated(const SilentSso result) {
    return result == SilentSso::TokenValid || result == SilentSso::Refreshed;
}

class GraphSession {
    friend class GraphSessionTest; // Declare the test class as a friend

public:
    std::string user_agent = "GraphCoro SDK/0.1.0";

    /**
     * \brief Creates a session talking to the configured endpoints with libcurl and caching to config.state_file.
     */
    explicit GraphSession(GraphConfig config);

    /**
     * \brief Creates a session with explicit collaborators.
     *
     * The scopes of config are normalized against refresh_enable. When caching is enabled a persisted
     * session is restored and validated, refreshing a stale token before returning.
     */
    GraphSession(GraphConfig config, std::shared_ptr<HttpClient> http_client, std::shared_ptr<StateStorage> storage,
                 IdGenerator generate_id = generate_uuid);

    /**
     * \brief Starts the authorization code flow.
     *
     * With caching enabled a cached or refreshable session is reused and the user is sent straight to the
     * post-login route. Otherwise a fresh nonce is issued and the user is redirected to the authorization endpoint.
     *
     * \param ctx The request that triggered the login.
     * \param login_redirect Route to redirect to once authenticated, "/" unless set by an earlier call.
     */
    [[nodiscard]] cppcoro::task<> login(RequestContext &ctx, std::optional<std::string> login_redirect = std::nullopt);

    // Clears the session and the persisted copy
    void logout();

    void logout(RequestContext &ctx, const std::string &redirect_to);

    /**
     * \brief Handles the provider redirect: verifies the state, exchanges the code and redirects to the login route.
     *
     * \return true when an access token was obtained, false when the provider returned none.
     * \throws StateMismatchError if the state parameter does not match the pending nonce.
     * \throws TransportError if the token endpoint could not be reached.
     */
    [[nodiscard]] cppcoro::task<bool> handle_callback(RequestContext &ctx);

    [[nodiscard]] cppcoro::task<SilentSso> silent_sso();

    /**
     * \brief Refreshes the access token when it expires in less than min_seconds and refresh is enabled.
     *
     * Call before making an authenticated request.
     */
    [[nodiscard]] cppcoro::task<> ensure_valid(std::int64_t min_seconds = 5);

    // false if no refresh token is held or the provider returned no access token
    [[nodiscard]] cppcoro::task<bool> refresh_access_token();

    /**
     * \brief Stores the tokens of a token endpoint response.
     *
     * A response without access_token logs the session out.
     */
    bool token_save(const Json::Value &body);

    /**
     * \brief GETs an API endpoint with a valid access token and returns the parsed response.
     */
    [[nodiscard]] cppcoro::task<Json::Value> api_get(std::string endpoint);

    [[nodiscard]] HttpHeaders authorized_headers(const HttpHeaders &overrides = {}) const;

    [[nodiscard]] std::string build_api_url(const std::string &url) const {
        return config.resolve_endpoint(url);
    }

    [[nodiscard]] std::int64_t seconds_until_expiry() const;

    [[nodiscard]] bool is_logged_in() const {
        return state.loggedin && seconds_until_expiry() > 0;
    }

    [[nodiscard]] AuthPhase auth_phase() const {
        return phase;
    }

    [[nodiscard]] const SessionState &session_state() const {
        return state;
    }

    [[nodiscard]] const GraphConfig &configuration() const {
        return config;
    }

    [[nodiscard]] std::string describe() const;

private:
    const GraphConfig config;
    std::shared_ptr<HttpClient> http_client;
    TokenStore token_store;
    IdGenerator generate_id;

    SessionState state;
    AuthPhase phase = AuthPhase::LoggedOut;
    std::string login_redirect = "/";

    void restore_state();

    // Writes the durable record, a storage failure is logged and the in-memory session kept
    void persist_state();

    [[nodiscard]] std::string generate_authorize_url(const std::string &nonce) const;

    /**
     * \brief Records the granted scopes and compares them with the requested ones.
     *
     * offline_access is not part of the comparison. A mismatch is only logged.
     *
     * \return true if the granted scopes match the requested ones.
     */
    bool verify_scopes(const std::string &granted_scopes);
};
