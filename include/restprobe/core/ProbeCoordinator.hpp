#pragma once

#include "restprobe/Config.hpp"
#include "restprobe/probe/EndpointProber.hpp"
#include "restprobe/sink/ResultSink.hpp"
#include "restprobe/targets/TargetExpander.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace restprobe::core {

struct RunSummary {
    std::size_t dispatched{0};
    std::size_t succeeded{0};
    std::size_t no_success{0};
    std::size_t errored{0};

    RunSummary& operator+=(const RunSummary& other);
};

class ProbeCoordinator {
public:
    // Invoked once per probed host, from the worker that probed it, without any
    // coordinator lock held. Several workers may call it at once.
    using ReportObserver = std::function<void(const probe::ProbeReport&)>;

    ProbeCoordinator(const Config& config, const probe::EndpointProber& prober, sink::ResultSink& sink);

    void set_report_observer(ReportObserver observer);

    // Probes every host of the sequence on a fresh worker pool and returns once
    // all of them finished. Per-host failures never escape.
    RunSummary run(targets::TargetSequence& targets);

private:
    enum class HostResult {
        Emitted,
        NoSuccess,
        Failed
    };

    const Config& config_;
    const probe::EndpointProber& prober_;
    sink::ResultSink& sink_;
    ReportObserver observer_;
    std::mutex observer_mutex_;

    HostResult process_host(const std::string& host);
};

}  // namespace restprobe::core
