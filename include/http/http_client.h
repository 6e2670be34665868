///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file http_client.h
 * @brief Minimal blocking HTTP client used by the lookup and persistence collaborators
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace FlightBridge {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status = 0;
    std::string body;

    bool Ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking request interface.
 *
 * Throws HttpError when no response was received at all. Any HTTP status,
 * including 4xx and 5xx, is returned normally.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse Get(const std::string& url, const HttpHeaders& headers = {}) = 0;
    virtual HttpResponse Post(const std::string& url, const std::string& body, const HttpHeaders& headers = {}) = 0;
};

/// Percent-encode everything but RFC 3986 unreserved characters (libcurl). Throws HttpError.
std::string UrlEscape(const std::string& value);

/// libcurl easy-API implementation; one handle per request, safe to share between threads
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 10);

    HttpResponse Get(const std::string& url, const HttpHeaders& headers = {}) override;
    HttpResponse Post(const std::string& url, const std::string& body, const HttpHeaders& headers = {}) override;

private:
    HttpResponse Perform(const std::string& url, const std::string* body, const HttpHeaders& headers);

    long timeout_seconds_;
};

} // namespace FlightBridge
