#include "graph_coro.hpp"

#include <chrono>
#include <set>

#include "cppcoro/sync_wait.hpp"
#include "spdlog/spdlog.h"

// Assumed lifetime when the token endpoint omits expires_in
static constexpr std::int64_t DEFAULT_EXPIRES_IN = 3600;

static std::int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static GraphConfig normalized(GraphConfig config) {
    config.normalize_scopes();
    return config;
}

GraphSession::GraphSession(GraphConfig config)
    : GraphSession(config, std::make_shared<CurlHttpClient>(),
                   std::make_shared<FileStateStorage>(config.state_file)) {
}

GraphSession::GraphSession(GraphConfig config, std::shared_ptr<HttpClient> http_client,
                           std::shared_ptr<StateStorage> storage, IdGenerator generate_id)
    : config(normalized(std::move(config))), http_client(std::move(http_client)),
      token_store(std::move(storage), this->config.cache_state), generate_id(std::move(generate_id)) {
    if (!this->http_client) {
        throw std::invalid_argument("session requires an http client");
    }
    if (!this->generate_id) {
        throw std::invalid_argument("session requires an id generator");
    }
    restore_state();
}

void GraphSession::restore_state() {
    auto restored = token_store.restore();
    if (!restored) {
        return;
    }

    state = std::move(*restored);
    phase = is_logged_in() ? AuthPhase::LoggedIn : AuthPhase::LoggedOut;
    spdlog::info("Restored cached session, token expires in {}s", seconds_until_expiry());

    try {
        cppcoro::sync_wait(ensure_valid());
    } catch (const TransportError &e) {
        spdlog::warn("Could not refresh the restored session: {}", e.what());
    }
}

void GraphSession::persist_state() {
    try {
        token_store.persist(state);
    } catch (const std::runtime_error &e) {
        spdlog::error("Could not persist the session: {}", e.what());
    }
}

cppcoro::task<> GraphSession::login(RequestContext &ctx, std::optional<std::string> login_redirect) {
    if (login_redirect) {
        this->login_redirect = std::move(*login_redirect);
    }

    // if caching is enabled, attempt silent SSO first
    if (config.cache_state) {
        if (const auto sso = co_await silent_sso(); sso_authenticated(sso)) {
            spdlog::info("Silent SSO succeeded, redirecting to {}", this->login_redirect);
            phase = AuthPhase::LoggedIn;
            ctx.redirect(this->login_redirect, 303);
            co_return;
        } else if (sso_available(sso)) {
            spdlog::warn("Silent SSO refresh failed, falling back to interactive login");
        }
    }

    state.pending_nonce = generate_id();
    state.authorization_url = generate_authorize_url(*state.pending_nonce);
    phase = AuthPhase::AwaitingCallback;
    spdlog::debug("Authorization URL: {}", state.authorization_url);

    ctx.redirect(state.authorization_url, 302);
}

std::string GraphSession::generate_authorize_url(const std::string &nonce) const {
    return config.auth_endpoint + "?" + build_query({
               {"response_type", "code"},
               {"client_id", config.client_id},
               {"redirect_uri", config.redirect_uri},
               {"scope", config.joined_scopes()},
               {"state", nonce},
               {"prompt", "select_account"},
           });
}

void GraphSession::logout() {
    state = SessionState{};
    phase = AuthPhase::LoggedOut;
    token_store.discard();
    spdlog::info("Logged out");
}

void GraphSession::logout(RequestContext &ctx, const std::string &redirect_to) {
    logout();
    ctx.redirect(redirect_to, 303);
}

cppcoro::task<bool> GraphSession::handle_callback(RequestContext &ctx) {
    // Verify that this authorization attempt came from this session by checking
    // the received state against the nonce sent with the authorization request.
    const auto received_state = ctx.query("state");
    if (!state.pending_nonce || *state.pending_nonce != received_state) {
        throw StateMismatchError(state.pending_nonce.value_or(""), received_state);
    }
    state.pending_nonce.reset();

    if (const auto error = ctx.query("error"); !error.empty()) {
        spdlog::warn("Authorization was denied: {} {}", error, ctx.query("error_description"));
        logout();
        co_return false;
    }

    phase = AuthPhase::ExchangingCode;
    Json::Value token_response;
    try {
        token_response = co_await http_client->post_form(config.token_endpoint, {
                                                             {"client_id", config.client_id},
                                                             {"client_secret", config.client_secret},
                                                             {"grant_type", "authorization_code"},
                                                             {"code", ctx.query("code")},
                                                             {"redirect_uri", config.redirect_uri},
                                                         });
    } catch (const TransportError &e) {
        spdlog::error("Authorization code exchange failed: {}", e.what());
        // A token held from an earlier login is still usable
        phase = is_logged_in() ? AuthPhase::LoggedIn : AuthPhase::LoggedOut;
        throw;
    }

    if (!token_save(token_response)) {
        co_return false;
    }

    persist_state();
    spdlog::info("Successfully exchanged code for token");
    ctx.redirect(login_redirect, 303);
    co_return true;
}

cppcoro::task<SilentSso> GraphSession::silent_sso() {
    if (seconds_until_expiry() > 0) {
        co_return SilentSso::TokenValid;
    }

    if (state.refresh_token) {
        const bool refreshed = co_await refresh_access_token();
        co_return refreshed ? SilentSso::Refreshed : SilentSso::RefreshFailed;
    }

    co_return SilentSso::Unavailable;
}

cppcoro::task<> GraphSession::ensure_valid(const std::int64_t min_seconds) {
    if (seconds_until_expiry() < min_seconds && config.refresh_enable) {
        co_await refresh_access_token();
    }
}

cppcoro::task<bool> GraphSession::refresh_access_token() {
    if (!state.refresh_token) {
        spdlog::debug("No refresh token available");
        co_return false;
    }

    spdlog::info("Refreshing access token");
    const auto token_response = co_await http_client->post_form(config.token_endpoint, {
                                                                    {"client_id", config.client_id},
                                                                    {"client_secret", config.client_secret},
                                                                    {"grant_type", "refresh_token"},
                                                                    {"refresh_token", *state.refresh_token},
                                                                });

    if (!token_save(token_response)) {
        co_return false;
    }
    persist_state();
    co_return true;
}

bool GraphSession::token_save(const Json::Value &body) {
    const auto response = parse_token_response(body);
    if (!response.access_token) {
        spdlog::warn("Token endpoint returned no access token: {} {}", response.error.value_or("unknown error"),
                     response.error_description.value_or(""));
        logout();
        return false;
    }

    // An omitted scope means the requested scopes were granted
    if (response.scope) {
        verify_scopes(*response.scope);
    } else {
        state.token_scope = config.joined_scopes();
    }

    state.access_token = response.access_token;
    state.token_expires_at = now_seconds() + response.expires_in.value_or(DEFAULT_EXPIRES_IN);
    // Providers that do not rotate refresh tokens omit it, keep the one we have
    if (response.refresh_token) {
        state.refresh_token = response.refresh_token;
    }
    state.loggedin = true;
    phase = AuthPhase::LoggedIn;
    return true;
}

bool GraphSession::verify_scopes(const std::string &granted_scopes) {
    state.token_scope = granted_scopes;

    std::set<std::string> scopes_returned;
    for (const auto &scope: split_spaces(granted_scopes)) {
        scopes_returned.insert(to_lower(scope));
    }

    std::set<std::string> scopes_expected;
    for (const auto &scope: config.scopes) {
        if (auto lowered = to_lower(scope); lowered != REFRESH_SCOPE) {
            scopes_expected.insert(std::move(lowered));
        }
    }

    if (scopes_expected != scopes_returned) {
        spdlog::warn("Scopes [{}] requested, but scopes [{}] returned with token",
                     join(std::vector<std::string>(scopes_expected.begin(), scopes_expected.end()), ", "),
                     join(std::vector<std::string>(scopes_returned.begin(), scopes_returned.end()), ", "));
        return false;
    }
    return true;
}

cppcoro::task<Json::Value> GraphSession::api_get(std::string endpoint) {
    co_await ensure_valid();
    if (!is_logged_in()) {
        throw std::runtime_error("not logged in");
    }

    const auto url = build_api_url(endpoint);
    spdlog::debug("GET {}", url);
    co_return co_await http_client->get_json(url, authorized_headers());
}

HttpHeaders GraphSession::authorized_headers(const HttpHeaders &overrides) const {
    HttpHeaders merged_headers = {
        {"User-Agent", user_agent},
        {"Authorization", "Bearer " + state.access_token.value_or("")},
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"SdkVersion", "graph-coro"},
        {"x-client-sku", "graph-coro"},
        {"client-request-id", generate_id()},
        {"return-client-request-id", "true"},
    };
    for (const auto &[name, value]: overrides) {
        merged_headers[name] = value;
    }
    return merged_headers;
}

std::int64_t GraphSession::seconds_until_expiry() const {
    const auto now = now_seconds();
    if (!state.access_token || now >= state.token_expires_at) {
        return 0;
    }
    return state.token_expires_at - now;
}

std::string GraphSession::describe() const {
    return std::string("<GraphSession(loggedin=") + (is_logged_in() ? "True" : "False") +
           ", client_id=" + config.client_id + ")>";
}
