///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file http_client.cpp
 * @brief CurlHttpClient implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "http/http_client.h"
#include "common/errors.h"
#include "logging/logger.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace FlightBridge {

namespace {

size_t WriteCallback(char* data, size_t size, size_t count, void* user) {
    auto* out = static_cast<std::string*>(user);
    out->append(data, size * count);
    return size * count;
}

void EnsureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

void SetOption(CURLcode rc, const char* option) {
    if (rc != CURLE_OK) {
        throw HttpError(std::string("failed to set ") + option + ": " + curl_easy_strerror(rc));
    }
}

} // namespace

std::string UrlEscape(const std::string& value) {
    EnsureCurlInitialized();
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw HttpError("curl_easy_init failed");
    }

    char* escaped = curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw HttpError("curl_easy_escape failed");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

CurlHttpClient::CurlHttpClient(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
    EnsureCurlInitialized();
}

HttpResponse CurlHttpClient::Get(const std::string& url, const HttpHeaders& headers) {
    return Perform(url, nullptr, headers);
}

HttpResponse CurlHttpClient::Post(const std::string& url, const std::string& body, const HttpHeaders& headers) {
    return Perform(url, &body, headers);
}

HttpResponse CurlHttpClient::Perform(const std::string& url, const std::string* body, const HttpHeaders& headers) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw HttpError("curl_easy_init failed");
    }

    HttpResponse response;

    SetOption(curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str()), "CURLOPT_URL");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback), "CURLOPT_WRITEFUNCTION");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body), "CURLOPT_WRITEDATA");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L), "CURLOPT_FOLLOWLOCATION");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_), "CURLOPT_TIMEOUT");
    SetOption(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");

    std::unique_ptr<curl_slist, CurlListDeleter> header_list;
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw HttpError("curl_slist_append failed");
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        SetOption(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get()), "CURLOPT_HTTPHEADER");
    }

    if (body) {
        SetOption(curl_easy_setopt(curl.get(), CURLOPT_POST, 1L), "CURLOPT_POST");
        SetOption(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str()), "CURLOPT_POSTFIELDS");
        SetOption(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size())),
                  "CURLOPT_POSTFIELDSIZE");
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw HttpError(std::string(body ? "POST " : "GET ") + "request failed: " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    LOG_TRACE("{} {} -> {}", body ? "POST" : "GET", url, response.status);
    return response;
}

} // namespace FlightBridge
