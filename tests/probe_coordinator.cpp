#include "restprobe/core/ProbeCoordinator.hpp"

#include "restprobe/Config.hpp"
#include "restprobe/log/StructuredLogger.hpp"
#include "restprobe/probe/EndpointProber.hpp"
#include "restprobe/sink/ResultSink.hpp"
#include "restprobe/targets/TargetExpander.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using restprobe::Config;
using restprobe::core::ProbeCoordinator;
using restprobe::core::RunSummary;
using restprobe::http::HttpRequest;
using restprobe::http::HttpResponse;
using restprobe::http::TransportStatus;
using restprobe::log::StructuredLogger;
using restprobe::probe::EndpointProber;
using restprobe::probe::ProbeReport;
using restprobe::sink::ResultSink;
using restprobe::targets::TargetSequence;

// Hosts ending in an even octet answer on 443, odd ones on 8888, ".13" never
// answers, ".66" makes the transport throw a std::exception and ".77" throws
// a plain int.
HttpResponse scripted_transport(const HttpRequest& request) {
    const auto host_begin = request.url.find("://") + 3;
    const auto host_end = request.url.find(':', host_begin);
    const auto host = request.url.substr(host_begin, host_end - host_begin);
    const auto last_octet = std::stoi(host.substr(host.rfind('.') + 1));
    const bool on_8888 = request.url.find(":8888/") != std::string::npos;

    if (last_octet == 66) {
        throw std::runtime_error("transport exploded");
    }
    if (last_octet == 77) {
        throw 77;
    }
    HttpResponse response{};
    if (last_octet == 13) {
        response.transport = TransportStatus::TimedOut;
        response.error = "Timeout was reached";
        return response;
    }
    response.transport = TransportStatus::Completed;
    const bool answers = (last_octet % 2 == 0) ? !on_8888 : on_8888;
    response.status_code = answers ? 200 : 404;
    response.body = answers ? "{\"host\":\"" + host + "\"}" : "";
    return response;
}

struct LogCapture {
    std::mutex mutex;
    std::vector<StructuredLogger::Record> records;

    LogCapture() {
        StructuredLogger::instance().set_sink([this](const StructuredLogger::Record& record) {
            std::scoped_lock lock(mutex);
            records.push_back(record);
        });
    }
    ~LogCapture() { StructuredLogger::instance().set_sink({}); }

    std::vector<std::string> hosts_for(const std::string& event) {
        std::scoped_lock lock(mutex);
        std::vector<std::string> hosts;
        for (const auto& record : records) {
            if (record.event == event) {
                hosts.push_back(record.field("host"));
            }
        }
        return hosts;
    }
};

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

void test_one_emission_per_host() {
    LogCapture logs;
    Config config{};
    config.worker_count = 4;
    std::ostringstream console;
    ResultSink sink(config, console);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);

    std::atomic<int> reports{0};
    coordinator.set_report_observer([&](const ProbeReport&) { reports.fetch_add(1); });

    auto targets = restprobe::targets::expand_input("10.9.0.0/27");
    const auto summary = coordinator.run(targets);

    assert(summary.dispatched == 30);
    assert(summary.succeeded == 29);
    assert(summary.no_success == 1);
    assert(summary.errored == 0);
    assert(reports.load() == 30);

    const auto output = console.str();
    for (int octet = 1; octet <= 30; ++octet) {
        const std::string host = "10.9.0." + std::to_string(octet);
        const auto frames = count_occurrences(output, "=== " + host + " (");
        assert(frames == (octet == 13 ? 0u : 1u));
        if (octet != 13) {
            const std::string port = octet % 2 == 0 ? "443" : "8888";
            assert(output.find("=== " + host + " (port " + port + ",") != std::string::npos);
        }
    }
    assert(count_occurrences(output, std::string(60, '=') + "\n") == 29);
    assert(logs.hosts_for("probe_exhausted") == std::vector<std::string>{"10.9.0.13"});
}

void test_failure_in_one_host_does_not_stop_others() {
    LogCapture logs;
    Config config{};
    config.worker_count = 2;
    std::ostringstream console;
    ResultSink sink(config, console);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);

    auto targets = TargetSequence::from_hosts("inline", {"10.1.0.66", "10.1.0.2", "10.1.0.3", "10.1.0.66x"});
    // "10.1.0.66x" parses as octet 66 as well.
    const auto summary = coordinator.run(targets);

    assert(summary.dispatched == 4);
    assert(summary.errored == 2);
    assert(summary.succeeded == 2);
    assert(summary.no_success == 0);

    const auto failed = logs.hosts_for("host_failed");
    const std::set<std::string> failed_set(failed.begin(), failed.end());
    assert((failed_set == std::set<std::string>{"10.1.0.66", "10.1.0.66x"}));
    assert(console.str().find("=== 10.1.0.2 ") != std::string::npos);
    assert(console.str().find("=== 10.1.0.3 ") != std::string::npos);
}

void test_non_standard_exception_is_contained() {
    LogCapture logs;
    Config config{};
    config.worker_count = 2;
    std::ostringstream console;
    ResultSink sink(config, console);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);

    auto targets = TargetSequence::from_hosts("inline", {"10.3.0.77", "10.3.0.4", "10.3.0.5"});
    const auto summary = coordinator.run(targets);

    assert(summary.dispatched == 3);
    assert(summary.errored == 1);
    assert(summary.succeeded == 2);
    assert(logs.hosts_for("host_failed") == std::vector<std::string>{"10.3.0.77"});
    assert(logs.hosts_for("worker_task_failed").empty());
    assert(console.str().find("=== 10.3.0.4 ") != std::string::npos);
    assert(console.str().find("=== 10.3.0.5 ") != std::string::npos);
}

// The observer runs outside the coordinator's lock: two workers can be inside
// it at once, and it may replace itself without deadlocking.
void test_observer_runs_unlocked() {
    Config config{};
    config.worker_count = 4;
    std::ostringstream console;
    ResultSink sink(config, console);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);

    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};
    coordinator.set_report_observer([&](const ProbeReport&) {
        calls.fetch_add(1);
        const int now = inside.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (peak.load() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        inside.fetch_sub(1);
    });

    auto targets = TargetSequence::from_hosts("inline", {"10.4.0.1", "10.4.0.2", "10.4.0.3", "10.4.0.4"});
    auto summary = coordinator.run(targets);
    assert(summary.succeeded == 4);
    assert(calls.load() == 4);
    assert(peak.load() >= 2);

    std::atomic<int> replaced{0};
    coordinator.set_report_observer([&](const ProbeReport&) {
        coordinator.set_report_observer([&](const ProbeReport&) { replaced.fetch_add(1); });
    });
    auto more = TargetSequence::from_hosts("inline", {"10.4.0.6", "10.4.0.8", "10.4.0.10"});
    summary = coordinator.run(more);
    assert(summary.succeeded == 3);
    assert(replaced.load() <= 2);
}

void test_output_failure_is_per_host() {
    LogCapture logs;
    const auto dir = std::filesystem::temp_directory_path() / "restprobe_coordinator_blocked";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    const auto blocker = dir / "file";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    Config config{};
    config.worker_count = 2;
    config.output_mode = Config::OutputMode::File;
    config.output_directory = blocker.string();
    ResultSink sink(config);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);

    auto targets = TargetSequence::from_hosts("inline", {"10.2.0.1", "10.2.0.2", "10.2.0.13"});
    const auto summary = coordinator.run(targets);
    assert(summary.dispatched == 3);
    assert(summary.errored == 2);
    assert(summary.no_success == 1);
    assert(logs.hosts_for("output_failed").size() == 2);

    RunSummary total{};
    total += summary;
    total += summary;
    assert(total.dispatched == 6 && total.errored == 4 && total.no_success == 2 && total.succeeded == 0);

    std::filesystem::remove_all(dir);
}

void test_empty_sequence() {
    Config config{};
    std::ostringstream console;
    ResultSink sink(config, console);
    EndpointProber prober(config, scripted_transport);
    ProbeCoordinator coordinator(config, prober, sink);
    auto targets = TargetSequence::from_hosts("empty", {});
    const auto summary = coordinator.run(targets);
    assert(summary.dispatched == 0);
    assert(console.str().empty());
}

}  // namespace

int main() {
    test_one_emission_per_host();
    test_failure_in_one_host_does_not_stop_others();
    test_non_standard_exception_is_contained();
    test_observer_runs_unlocked();
    test_output_failure_is_per_host();
    test_empty_sequence();
    return 0;
}
