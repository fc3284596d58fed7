#pragma once

#include "restprobe/Config.hpp"
#include "restprobe/Types.hpp"
#include "restprobe/http/HttpClient.hpp"
#include "restprobe/json/Json.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace restprobe::probe {

struct Success {
    json::Value payload;
};

struct HttpFailure {
    long status_code{0};
};

struct Timeout {};

struct TransportError {
    std::string message;
};

// HTTP 200 whose body is not a JSON document.
struct SerializationError {
    std::string message;
};

using ProbeOutcome = std::variant<Success, HttpFailure, Timeout, TransportError, SerializationError>;

std::string_view outcome_kind(const ProbeOutcome& outcome);

struct ProbeAttempt {
    EndpointDescriptor endpoint;
    ProbeOutcome outcome;
};

struct ProbeReport {
    std::string host;
    bool new_device{false};
    std::vector<ProbeAttempt> attempts;
    std::optional<std::size_t> success_index;

    bool succeeded() const noexcept { return success_index.has_value(); }
    const ProbeAttempt* success() const;
    const json::Value* payload() const;
};

class EndpointProber {
public:
    // Returns true when a persisted record already exists for the host.
    using RecordCheck = std::function<bool(const std::string&)>;

    EndpointProber(const Config& config,
                   http::HttpGetFunction transport = http::curl_get,
                   RecordCheck record_check = {});

    // Tries every endpoint in declared order and stops at the first Success.
    ProbeReport probe(const std::string& host) const;

private:
    const Config& config_;
    http::HttpGetFunction transport_;
    RecordCheck record_check_;

    http::HttpRequest build_request(const std::string& host, const EndpointDescriptor& endpoint) const;
    ProbeOutcome attempt(const std::string& host, const EndpointDescriptor& endpoint) const;
    static void log_attempt(const std::string& host, const ProbeAttempt& attempt);
};

}  // namespace restprobe::probe
