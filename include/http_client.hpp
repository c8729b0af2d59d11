#pragma once
#include <map>
#include <string>

#include "cppcoro/task.hpp"
#include <curl/curl.h>
#include <json/json.h>

#include "utils.hpp"

using HttpHeaders = std::map<std::string, std::string>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * \brief POSTs form-encoded fields to a token endpoint and returns the parsed JSON body.
     *
     * An OAuth error body (an object with an "error" member) is returned even with a non-2xx status.
     * Any other failure throws TransportError.
     */
    [[nodiscard]] virtual cppcoro::task<Json::Value> post_form(std::string url, QueryParams fields) = 0;

    /**
     * \brief GETs a JSON document. Any non-2xx status throws TransportError.
     */
    [[nodiscard]] virtual cppcoro::task<Json::Value> get_json(std::string url, HttpHeaders headers) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30, bool verify_peer = true);

    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient &) = delete;

    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    [[nodiscard]] cppcoro::task<Json::Value> post_form(std::string url, QueryParams fields) override;

    [[nodiscard]] cppcoro::task<Json::Value> get_json(std::string url, HttpHeaders headers) override;

private:
    CURL *curl;
    long timeout_seconds;
    bool verify_peer;

    // Performs the prepared request, returns the HTTP status and fills body
    long perform(const std::string &url, std::string &body) const;
};
