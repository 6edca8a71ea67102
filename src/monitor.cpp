// =============================================================================
// monitor.cpp - Periodic tasks and the Confirmation Monitor
// =============================================================================

#include "kald/monitor.hpp"
#include "kald/log.hpp"

#include <exception>

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("monitor");
    return j;
}

} // namespace

// =============================================================================
// PeriodicTask
// =============================================================================

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body)
    : name_(std::move(name))
    , interval_(interval)
    , body_(std::move(body)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }

    worker_ = std::thread(&PeriodicTask::worker_loop, this);
    journal().debug("started {} (every {} ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;  // Already stopped
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    journal().debug("stopped {}", name_);
}

void PeriodicTask::run_once() {
    try {
        body_();
    } catch (const std::exception& e) {
        journal().error("{} iteration failed: {}", name_, e.what());
    }
    iterations_.fetch_add(1, std::memory_order_relaxed);
}

void PeriodicTask::worker_loop() {
    while (running_.load()) {
        {
            std::unique_lock lock(wake_mutex_);
            bool stopping = wake_cv_.wait_for(lock, interval_, [this] {
                return !running_.load();
            });
            if (stopping) {
                return;
            }
        }
        run_once();
    }
}

// =============================================================================
// ConfirmationMonitor
// =============================================================================

ConfirmationMonitor::ConfirmationMonitor(TransferMachine& transfers, const IClock& clock,
                                         std::chrono::milliseconds interval)
    : transfers_(transfers)
    , clock_(clock)
    , task_("confirmation-monitor", interval, [this] { scan(); }) {}

size_t ConfirmationMonitor::scan() {
    scans_.fetch_add(1, std::memory_order_relaxed);

    TimestampMs now = clock_.now_ms();
    std::vector<std::string> candidates = transfers_.expired_candidates(now);

    size_t refunded = 0;
    for (const auto& id : candidates) {
        int32_t rc = transfers_.expire(id, now);
        if (rc == errors::OK) {
            ++refunded;
            continue;
        }

        // Confirmed or settled since the snapshot; nothing to do
        if (rc == errors::NOT_PENDING || rc == errors::NOT_EXPIRED) {
            continue;
        }

        errors_.fetch_add(1, std::memory_order_relaxed);
        journal().error("timeout processing for {} failed: {}; retrying next pass",
                        id, errors::describe(rc));
    }

    refunded_.fetch_add(refunded, std::memory_order_relaxed);
    if (refunded > 0) {
        journal().info("refunded {} timed-out transfers", refunded);
    }
    return refunded;
}

ConfirmationMonitor::Stats ConfirmationMonitor::get_stats() const {
    Stats stats;
    stats.scans = scans_.load(std::memory_order_relaxed);
    stats.refunded = refunded_.load(std::memory_order_relaxed);
    stats.errors = errors_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace kald
