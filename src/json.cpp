#include "json.hpp"

#include <charconv>

#include "spdlog/spdlog.h"

// Longest token lifetime accepted from a token endpoint, one year
static constexpr std::int64_t MAX_EXPIRES_IN = 365 * 24 * 60 * 60;

static std::optional<std::string> optional_string(const Json::Value &root, const char *key) {
    if (!root.isMember(key) || !root[key].isString()) {
        return std::nullopt;
    }
    return root[key].asString();
}

TokenResponse parse_token_response(const Json::Value &root) {
    TokenResponse response;
    if (!root.isObject()) {
        return response;
    }

    response.access_token = optional_string(root, "access_token");
    response.refresh_token = optional_string(root, "refresh_token");
    response.scope = optional_string(root, "scope");
    response.token_type = optional_string(root, "token_type");
    response.error = optional_string(root, "error");
    response.error_description = optional_string(root, "error_description");

    // Some providers send expires_in as a string
    const auto &expires_in = root["expires_in"];
    std::optional<std::int64_t> lifetime;
    if (expires_in.isInt64()) {
        lifetime = expires_in.asInt64();
    } else if (expires_in.isString()) {
        const auto text = expires_in.asString();
        std::int64_t value = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc() && end == text.data() + text.size()) {
            lifetime = value;
        }
    }

    if (lifetime && *lifetime >= 0 && *lifetime <= MAX_EXPIRES_IN) {
        response.expires_in = lifetime;
    } else if (!expires_in.isNull()) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        spdlog::warn("Ignoring malformed expires_in value: {}", Json::writeString(writer, expires_in));
    }

    return response;
}

Json::Value session_state_to_json(const SessionState &state) {
    Json::Value root(Json::objectValue);
    root["access_token"] = state.access_token ? Json::Value(*state.access_token) : Json::Value(Json::nullValue);
    root["refresh_token"] = state.refresh_token ? Json::Value(*state.refresh_token) : Json::Value(Json::nullValue);
    root["token_expires_at"] = static_cast<Json::Int64>(state.token_expires_at);
    root["token_scope"] = state.token_scope;
    root["loggedin"] = state.loggedin;
    return root;
}

SessionState session_state_from_json(const Json::Value &root) {
    SessionState state;
    if (!root.isObject()) {
        return state;
    }

    state.access_token = optional_string(root, "access_token");
    state.refresh_token = optional_string(root, "refresh_token");
    // Older records stored a fractional timestamp
    if (root["token_expires_at"].isNumeric()) {
        state.token_expires_at = static_cast<std::int64_t>(root["token_expires_at"].asDouble());
    }
    if (root["token_scope"].isString()) {
        state.token_scope = root["token_scope"].asString();
    }
    if (root["loggedin"].isBool()) {
        state.loggedin = root["loggedin"].asBool();
    }
    return state;
}

std::optional<Json::Value> parse_json(const std::string &text) {
    Json::Value root;
    Json::Reader reader;
    if (const bool parse_status = reader.parse(text, root); !parse_status) {
        return std::nullopt;
    }
    return root;
}
