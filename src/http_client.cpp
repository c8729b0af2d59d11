#include "http_client.hpp"

#include "spdlog/spdlog.h"

#include "errors.hpp"
#include "json.hpp"

static size_t WriteCallback(void *contents, const size_t size, const size_t nmemb, void *userp) {
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

static bool is_success(const long status) {
    return status >= 200 && status < 300;
}

CurlHttpClient::CurlHttpClient(const long timeout_seconds, const bool verify_peer)
    : curl(curl_easy_init()), timeout_seconds(timeout_seconds), verify_peer(verify_peer) {
    if (!curl) {
        throw std::runtime_error("http client is not initialized");
    }
}

CurlHttpClient::~CurlHttpClient() {
    curl_easy_cleanup(curl);
}

long CurlHttpClient::perform(const std::string &url, std::string &body) const {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    /* enable all supported built-in compressions */
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (!verify_peer) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    //curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);

    if (const CURLcode res = curl_easy_perform(curl); res != CURLE_OK) {
        throw TransportError("request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    return http_code;
}

cppcoro::task<Json::Value> CurlHttpClient::post_form(std::string url, QueryParams fields) {
    curl_easy_reset(curl);

    // Make it a POST request
    curl_easy_setopt(curl, CURLOPT_POST, 1L);

    const auto post_fields = build_query(fields);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_fields.c_str());

    curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    std::string str_buffer;
    long http_code = 0;
    try {
        http_code = perform(url, str_buffer);
    } catch (const TransportError &) {
        curl_slist_free_all(headers);
        throw;
    }
    curl_slist_free_all(headers);

    spdlog::debug("Token endpoint responded with status {}", http_code);

    const auto root = parse_json(str_buffer);
    if (!root || !root->isObject()) {
        throw TransportError("failed to parse response from " + url, http_code, str_buffer);
    }

    // OAuth error responses come back as 400/401 with a JSON body and are handled by the caller
    if (!is_success(http_code) && !root->isMember("error")) {
        throw TransportError("request to " + url + " failed with status " + std::to_string(http_code), http_code,
                             str_buffer);
    }

    co_return *root;
}

cppcoro::task<Json::Value> CurlHttpClient::get_json(std::string url, HttpHeaders headers) {
    curl_easy_reset(curl);

    curl_slist *header_list = nullptr;
    for (const auto &[name, value]: headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    std::string str_buffer;
    long http_code = 0;
    try {
        http_code = perform(url, str_buffer);
    } catch (const TransportError &) {
        curl_slist_free_all(header_list);
        throw;
    }
    curl_slist_free_all(header_list);

    spdlog::debug("GET {} responded with status {}", url, http_code);

    if (!is_success(http_code)) {
        throw TransportError("request to " + url + " failed with status " + std::to_string(http_code), http_code,
                             str_buffer);
    }

    const auto root = parse_json(str_buffer);
    if (!root) {
        throw TransportError("failed to parse response from " + url, http_code, str_buffer);
    }

    co_return *root;
}
