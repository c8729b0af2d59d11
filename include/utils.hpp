#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>

using QueryParams = std::vector<std::pair<std::string, std::string>>;

inline std::string url_encode(const std::string &decoded) {
    const auto encoded_value = curl_easy_escape(nullptr, decoded.c_str(), static_cast<int>(decoded.length()));
    std::string result(encoded_value);
    curl_free(encoded_value);
    return result;
}

inline std::string url_decode(std::string encoded) {
    // Form encoding uses '+' for spaces, curl only understands %20
    std::replace(encoded.begin(), encoded.end(), '+', ' ');
    int decoded_length = 0;
    const auto decoded_value = curl_easy_unescape(nullptr, encoded.c_str(), static_cast<int>(encoded.length()),
                                                  &decoded_length);
    if (!decoded_value) {
        return {};
    }
    std::string result(decoded_value, static_cast<size_t>(decoded_length));
    curl_free(decoded_value);
    return result;
}

inline std::string build_query(const QueryParams &params) {
    std::string query;
    for (const auto &[key, value]: params) {
        if (!query.empty()) {
            query += "&";
        }
        query += url_encode(key) + "=" + url_encode(value);
    }
    return query;
}

/**
 * \brief Parses the query component of a URL (or a bare query string) into a map.
 *
 * Anything before the first '?' and after the first '#' is ignored. Repeated keys keep the first value.
 */
inline std::map<std::string, std::string> parse_query(const std::string &url) {
    std::map<std::string, std::string> params;

    auto query = url;
    if (const auto question = query.find('?'); question != std::string::npos) {
        query = query.substr(question + 1);
    }
    if (const auto fragment = query.find('#'); fragment != std::string::npos) {
        query = query.substr(0, fragment);
    }

    std::stringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto equals = pair.find('=');
        auto key = url_decode(pair.substr(0, equals));
        auto value = equals == std::string::npos ? std::string() : url_decode(pair.substr(equals + 1));
        params.emplace(std::move(key), std::move(value));
    }
    return params;
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::vector<std::string> split_spaces(const std::string &value) {
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ' ')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

// Random version 4 UUID, used for authorization nonces and client-request-id headers.
// Every digit is drawn from the operating system entropy source, nonces must not be predictable.
inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(rd);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(rd);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(rd);
    ss << "-";
    ss << dis2(rd);
    for (int i = 0; i < 3; i++) ss << dis(rd);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(rd);

    return ss.str();
}
