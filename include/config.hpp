#pragma once
#include <string>
#include <vector>

#include <json/json.h>

inline constexpr auto GRAPH_RESOURCE = "https://graph.microsoft.com/";
inline constexpr auto GRAPH_API_VERSION = "v1.0";
inline constexpr auto GRAPH_AUTHORITY_URL = "https://login.microsoftonline.com/common";
inline constexpr auto GRAPH_AUTH_ENDPOINT = "/oauth2/v2.0/authorize";
inline constexpr auto GRAPH_TOKEN_ENDPOINT = "/oauth2/v2.0/token";
inline constexpr auto REFRESH_SCOPE = "offline_access";

/**
 * \brief Settings of a GraphSession.
 *
 * client_id, client_secret, redirect_uri and scopes must be provided, everything else has a default.
 */
struct GraphConfig {
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri;
    std::vector<std::string> scopes;

    std::string resource = GRAPH_RESOURCE;
    std::string api_version = GRAPH_API_VERSION;
    std::string authority_url = GRAPH_AUTHORITY_URL;
    std::string auth_endpoint = std::string(GRAPH_AUTHORITY_URL) + GRAPH_AUTH_ENDPOINT;
    std::string token_endpoint = std::string(GRAPH_AUTHORITY_URL) + GRAPH_TOKEN_ENDPOINT;

    // Persist the session to state_file and attempt silent SSO on login
    bool cache_state = false;
    // Request offline_access and refresh expiring tokens
    bool refresh_enable = true;
    std::string state_file = "state.json";

    /**
     * \brief Adds offline_access when refresh is enabled, removes it otherwise.
     *
     * refresh_enable takes precedence over an explicitly requested offline_access scope.
     */
    void normalize_scopes();

    [[nodiscard]] std::string joined_scopes() const;

    /**
     * \brief Converts a relative endpoint (e.g. "me") into a full API URL.
     *
     * Absolute http(s) URLs are returned unchanged, leading slashes of relative ones are ignored.
     */
    [[nodiscard]] std::string resolve_endpoint(const std::string &url) const;

    /**
     * \brief Merges a JSON object of overrides onto the defaults.
     *
     * Unknown keys are logged as warnings, known keys with a wrong type throw std::runtime_error.
     */
    [[nodiscard]] static GraphConfig from_json(const Json::Value &root);

    [[nodiscard]] static GraphConfig from_file(const std::string &path);
};
