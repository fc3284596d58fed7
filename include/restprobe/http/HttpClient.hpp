#pragma once

#include "restprobe/Types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace restprobe::http {

struct BasicAuth {
    std::string username;
    std::string password;
};

struct HttpRequest {
    std::string url;
    HeaderList headers;
    std::optional<BasicAuth> auth;
    bool verify_tls{false};
    std::chrono::seconds timeout{std::chrono::seconds(3)};
};

enum class TransportStatus {
    Completed,
    TimedOut,
    Failed
};

struct HttpResponse {
    TransportStatus transport{TransportStatus::Failed};
    long status_code{0};
    std::string body;
    std::string error;
};

// Blocking GET. Never throws for network conditions; the outcome is carried by
// HttpResponse::transport.
using HttpGetFunction = std::function<HttpResponse(const HttpRequest&)>;

HttpResponse curl_get(const HttpRequest& request);

}  // namespace restprobe::http
