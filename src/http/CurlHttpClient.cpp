#include "restprobe/http/HttpClient.hpp"

#include <string>

#include <curl/curl.h>

namespace restprobe::http {

namespace {

constexpr const char* kUserAgent = "restprobe/1.0";

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

bool is_timeout(CURLcode rc) {
    return rc == CURLE_OPERATION_TIMEDOUT;
}

}  // namespace

HttpResponse curl_get(const HttpRequest& request) {
    HttpResponse response{};

    // curl_global_init is not thread-safe; the static initializer runs it once
    // before any worker reaches curl_easy_init.
    static const bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    if (!curl_ready) {
        response.error = "Unable to initialize libcurl";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Unable to allocate curl handle";
        return response;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        struct curl_slist* appended = curl_slist_append(headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
            response.error = "Unable to build request headers";
            return response;
        }
        headers = appended;
    }

    const long timeout_seconds = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
    if (request.auth) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl, CURLOPT_USERNAME, request.auth->username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, request.auth->password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.transport = is_timeout(rc) ? TransportStatus::TimedOut : TransportStatus::Failed;
        response.error = curl_easy_strerror(rc);
        response.body.clear();
    } else {
        response.transport = TransportStatus::Completed;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

}  // namespace restprobe::http
