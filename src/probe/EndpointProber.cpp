#include "restprobe/probe/EndpointProber.hpp"

#include "restprobe/log/StructuredLogger.hpp"

#include <string>
#include <utility>

namespace restprobe::probe {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr long kHttpOk = 200;

log::StructuredLogger::FieldList attempt_fields(const std::string& host, const EndpointDescriptor& endpoint) {
    return {
        {"host", host},
        {"endpoint", endpoint.name},
        {"port", std::to_string(endpoint.port)},
    };
}

}  // namespace

std::string_view outcome_kind(const ProbeOutcome& outcome) {
    return std::visit(Overloaded{
                          [](const Success&) -> std::string_view { return "success"; },
                          [](const HttpFailure&) -> std::string_view { return "http_failure"; },
                          [](const Timeout&) -> std::string_view { return "timeout"; },
                          [](const TransportError&) -> std::string_view { return "transport_error"; },
                          [](const SerializationError&) -> std::string_view { return "serialization_error"; },
                      },
                      outcome);
}

const ProbeAttempt* ProbeReport::success() const {
    if (!success_index || *success_index >= attempts.size()) {
        return nullptr;
    }
    return &attempts[*success_index];
}

const json::Value* ProbeReport::payload() const {
    const auto* winner = success();
    if (!winner) {
        return nullptr;
    }
    return &std::get<Success>(winner->outcome).payload;
}

EndpointProber::EndpointProber(const Config& config, http::HttpGetFunction transport, RecordCheck record_check)
    : config_(config),
      transport_(std::move(transport)),
      record_check_(std::move(record_check)) {}

ProbeReport EndpointProber::probe(const std::string& host) const {
    ProbeReport report{};
    report.host = host;

    if (record_check_ && !record_check_(host)) {
        report.new_device = true;
        log::StructuredLogger::instance().info("new_device", {{"host", host}});
    }

    for (const auto& endpoint : config_.endpoints) {
        ProbeAttempt current{endpoint, attempt(host, endpoint)};
        log_attempt(host, current);
        const bool won = std::holds_alternative<Success>(current.outcome);
        report.attempts.push_back(std::move(current));
        if (won) {
            report.success_index = report.attempts.size() - 1;
            return report;
        }
    }

    log::StructuredLogger::instance().warning(
        "probe_exhausted",
        {{"host", host}, {"attempts", std::to_string(report.attempts.size())}});
    return report;
}

http::HttpRequest EndpointProber::build_request(const std::string& host, const EndpointDescriptor& endpoint) const {
    http::HttpRequest request{};
    request.url = endpoint.url_for(host);
    request.headers = endpoint.headers;
    request.auth = http::BasicAuth{config_.username, config_.password};
    request.verify_tls = config_.verify_tls;
    request.timeout = config_.timeout;
    return request;
}

ProbeOutcome EndpointProber::attempt(const std::string& host, const EndpointDescriptor& endpoint) const {
    const auto response = transport_(build_request(host, endpoint));
    switch (response.transport) {
        case http::TransportStatus::TimedOut:
            return Timeout{};
        case http::TransportStatus::Failed:
            return TransportError{response.error.empty() ? std::string{"transport failure"} : response.error};
        case http::TransportStatus::Completed:
            break;
    }

    if (response.status_code != kHttpOk) {
        return HttpFailure{response.status_code};
    }

    json::Value payload;
    std::string error;
    if (!json::try_parse(response.body, payload, error)) {
        return SerializationError{std::move(error)};
    }
    return Success{std::move(payload)};
}

void EndpointProber::log_attempt(const std::string& host, const ProbeAttempt& attempt) {
    auto& logger = log::StructuredLogger::instance();
    auto fields = attempt_fields(host, attempt.endpoint);
    std::visit(Overloaded{
                   [&](const Success&) { logger.info("probe_success", std::move(fields)); },
                   [&](const HttpFailure& failure) {
                       fields.emplace_back("status", std::to_string(failure.status_code));
                       logger.warning("probe_http_failure", std::move(fields));
                   },
                   [&](const Timeout&) { logger.warning("probe_timeout", std::move(fields)); },
                   [&](const TransportError& failure) {
                       fields.emplace_back("error", failure.message);
                       logger.warning("probe_transport_error", std::move(fields));
                   },
                   [&](const SerializationError& failure) {
                       fields.emplace_back("error", failure.message);
                       logger.warning("probe_bad_body", std::move(fields));
                   },
               },
               attempt.outcome);
}

}  // namespace restprobe::probe
