#include "restprobe/core/ProbeCoordinator.hpp"

#include "restprobe/core/WorkerPool.hpp"
#include "restprobe/log/StructuredLogger.hpp"

#include <atomic>
#include <exception>
#include <string>
#include <utility>

namespace restprobe::core {

RunSummary& RunSummary::operator+=(const RunSummary& other) {
    dispatched += other.dispatched;
    succeeded += other.succeeded;
    no_success += other.no_success;
    errored += other.errored;
    return *this;
}

ProbeCoordinator::ProbeCoordinator(const Config& config, const probe::EndpointProber& prober, sink::ResultSink& sink)
    : config_(config),
      prober_(prober),
      sink_(sink) {}

void ProbeCoordinator::set_report_observer(ReportObserver observer) {
    std::scoped_lock lock(observer_mutex_);
    observer_ = std::move(observer);
}

RunSummary ProbeCoordinator::run(targets::TargetSequence& targets) {
    std::atomic<std::size_t> succeeded{0};
    std::atomic<std::size_t> no_success{0};
    std::atomic<std::size_t> errored{0};
    std::size_t dispatched = 0;

    const auto workers = config_.worker_count > 0 ? config_.worker_count : WorkerPool::default_worker_count();
    {
        WorkerPool pool(workers, config_.queue_capacity);
        while (auto next = targets.next()) {
            pool.submit([this, host = std::move(*next), &succeeded, &no_success, &errored] {
                switch (process_host(host)) {
                    case HostResult::Emitted:
                        succeeded.fetch_add(1, std::memory_order_relaxed);
                        break;
                    case HostResult::NoSuccess:
                        no_success.fetch_add(1, std::memory_order_relaxed);
                        break;
                    case HostResult::Failed:
                        errored.fetch_add(1, std::memory_order_relaxed);
                        break;
                }
            });
            ++dispatched;
        }
        pool.shutdown();
    }

    RunSummary summary{};
    summary.dispatched = dispatched;
    summary.succeeded = succeeded.load();
    summary.no_success = no_success.load();
    summary.errored = errored.load();
    return summary;
}

ProbeCoordinator::HostResult ProbeCoordinator::process_host(const std::string& host) {
    auto& logger = log::StructuredLogger::instance();
    try {
        const auto report = prober_.probe(host);
        ReportObserver observer;
        {
            std::scoped_lock lock(observer_mutex_);
            observer = observer_;
        }
        if (observer) {
            observer(report);
        }
        const auto* winner = report.success();
        if (!winner) {
            return HostResult::NoSuccess;
        }
        try {
            sink_.emit(host, winner->endpoint, *report.payload());
        } catch (const sink::SinkError& ex) {
            logger.error("output_failed", {{"host", host}, {"code", ex.code}, {"error", ex.message}});
            return HostResult::Failed;
        }
        return HostResult::Emitted;
    } catch (const std::exception& ex) {
        logger.error("host_failed", {{"host", host}, {"error", ex.what()}});
    } catch (...) {
        logger.error("host_failed", {{"host", host}, {"error", "unknown exception"}});
    }
    return HostResult::Failed;
}

}  // namespace restprobe::core
