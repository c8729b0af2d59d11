#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "spdlog/spdlog.h"

#include "json.hpp"
#include "utils.hpp"

void GraphConfig::normalize_scopes() {
    scopes.erase(std::remove(scopes.begin(), scopes.end(), REFRESH_SCOPE), scopes.end());
    if (refresh_enable) {
        scopes.emplace_back(REFRESH_SCOPE);
    }
}

std::string GraphConfig::joined_scopes() const {
    return join(scopes, " ");
}

std::string GraphConfig::resolve_endpoint(const std::string &url) const {
    if (const auto lowered = to_lower(url.substr(0, 8));
        lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0) {
        return url;
    }

    auto base = resource;
    if (!base.empty() && base.back() != '/') {
        base += "/";
    }
    base += api_version + "/";

    const auto first = url.find_first_not_of('/');
    return base + (first == std::string::npos ? std::string() : url.substr(first));
}

static std::string string_field(const Json::Value &root, const char *key) {
    if (!root[key].isString()) {
        throw std::runtime_error(std::string("invalid configuration: ") + key + " must be a string");
    }
    return root[key].asString();
}

static bool bool_field(const Json::Value &root, const char *key) {
    if (!root[key].isBool()) {
        throw std::runtime_error(std::string("invalid configuration: ") + key + " must be a boolean");
    }
    return root[key].asBool();
}

GraphConfig GraphConfig::from_json(const Json::Value &root) {
    if (!root.isObject()) {
        throw std::runtime_error("invalid configuration: expected a JSON object");
    }

    static const std::set<std::string> known_keys = {
        "client_id", "client_secret", "redirect_uri", "scopes", "resource", "api_version", "authority_url",
        "auth_endpoint", "token_endpoint", "cache_state", "refresh_enable", "state_file"
    };
    for (const auto &key: root.getMemberNames()) {
        if (!known_keys.contains(key)) {
            spdlog::warn("Unknown configuration key \"{}\" ignored", key);
        }
    }

    GraphConfig config;
    if (root.isMember("client_id")) config.client_id = string_field(root, "client_id");
    if (root.isMember("client_secret")) config.client_secret = string_field(root, "client_secret");
    if (root.isMember("redirect_uri")) config.redirect_uri = string_field(root, "redirect_uri");
    if (root.isMember("resource")) config.resource = string_field(root, "resource");
    if (root.isMember("api_version")) config.api_version = string_field(root, "api_version");
    if (root.isMember("cache_state")) config.cache_state = bool_field(root, "cache_state");
    if (root.isMember("refresh_enable")) config.refresh_enable = bool_field(root, "refresh_enable");
    if (root.isMember("state_file")) config.state_file = string_field(root, "state_file");

    if (root.isMember("scopes")) {
        if (!root["scopes"].isArray()) {
            throw std::runtime_error("invalid configuration: scopes must be an array of strings");
        }
        for (const auto &scope: root["scopes"]) {
            if (!scope.isString()) {
                throw std::runtime_error("invalid configuration: scopes must be an array of strings");
            }
            config.scopes.push_back(scope.asString());
        }
    }

    // Endpoints follow an overridden authority unless they are overridden as well
    if (root.isMember("authority_url")) {
        config.authority_url = string_field(root, "authority_url");
        config.auth_endpoint = config.authority_url + GRAPH_AUTH_ENDPOINT;
        config.token_endpoint = config.authority_url + GRAPH_TOKEN_ENDPOINT;
    }
    if (root.isMember("auth_endpoint")) config.auth_endpoint = string_field(root, "auth_endpoint");
    if (root.isMember("token_endpoint")) config.token_endpoint = string_field(root, "token_endpoint");

    config.normalize_scopes();

    if (config.client_id.empty() || config.redirect_uri.empty()) {
        spdlog::warn("Configuration is missing client_id or redirect_uri");
    }

    return config;
}

GraphConfig GraphConfig::from_file(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    const auto root = parse_json(buffer.str());
    if (!root) {
        throw std::runtime_error("failed to parse configuration file: " + path);
    }
    spdlog::debug("Loaded configuration from {}", path);
    return from_json(*root);
}
