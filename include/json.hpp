#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <json/json.h>

/**
 * \brief Body of a token endpoint response (RFC 6749 section 5.1 / 5.2).
 *
 * Every field is optional: a successful response carries access_token, an error response carries error.
 */
struct TokenResponse {
    std::optional<std::string> access_token;
    std::optional<std::string> refresh_token;
    std::optional<std::int64_t> expires_in;
    std::optional<std::string> scope;
    std::optional<std::string> token_type;
    std::optional<std::string> error;
    std::optional<std::string> error_description;
};

struct SessionState {
    std::optional<std::string> access_token;
    std::optional<std::string> refresh_token;
    // Epoch seconds, 0 when no token has been issued
    std::int64_t token_expires_at = 0;
    std::string token_scope;
    bool loggedin = false;

    // Request scoped, never persisted
    std::optional<std::string> pending_nonce;
    std::string authorization_url;
};

[[nodiscard]] TokenResponse parse_token_response(const Json::Value &root);

// Only the durable fields: access_token, refresh_token, token_expires_at, token_scope, loggedin
[[nodiscard]] Json::Value session_state_to_json(const SessionState &state);

[[nodiscard]] SessionState session_state_from_json(const Json::Value &root);

[[nodiscard]] std::optional<Json::Value> parse_json(const std::string &text);
