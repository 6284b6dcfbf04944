#include "oracle/curl_http_transport.hpp"
#include "spdlog/spdlog.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace holdem_eval {

namespace {

std::once_flag curl_init_flag;

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlString = std::unique_ptr<char, decltype(&curl_free)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string build_url(CURL* handle, const std::string& url, const QueryParams& query) {
    std::string full = url;
    char separator = full.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : query) {
        CurlString k(curl_easy_escape(handle, key.c_str(), static_cast<int>(key.size())), &curl_free);
        CurlString v(curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size())), &curl_free);
        if (!k || !v) {
            throw TransportError("curl_easy_escape failed for parameter '" + key + "'");
        }
        full += separator;
        full += k.get();
        full += '=';
        full += v.get();
        separator = '&';
    }
    return full;
}

} // namespace

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(curl_init_flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("CurlHttpTransport: curl_global_init a échoué : {}", curl_easy_strerror(rc));
        }
    });
}

HttpResponse CurlHttpTransport::get(const std::string& url,
                                    const QueryParams& query,
                                    std::chrono::milliseconds timeout) {
    CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        throw TransportError("curl_easy_init failed");
    }

    const std::string full_url = build_url(handle.get(), url, query);
    HttpResponse response;

    CurlHeaders headers(curl_slist_append(nullptr, "Accept: application/json"), &curl_slist_free_all);

    curl_easy_setopt(handle.get(), CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    // Pas de signaux : l'appel tourne sur un thread de travail
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);

    spdlog::trace("CurlHttpTransport: GET {}", full_url);
    const CURLcode rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK) {
        throw TransportError(std::string("GET ") + url + " failed: " + curl_easy_strerror(rc));
    }
    if (curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
        throw TransportError("GET " + url + ": no HTTP status available");
    }
    return response;
}

} // namespace holdem_eval
