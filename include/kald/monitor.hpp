#ifndef KALD_MONITOR_HPP
#define KALD_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "types.hpp"
#include "transfer.hpp"
#include "services.hpp"

namespace kald {

// =============================================================================
// PeriodicTask - ticker + worker thread
// =============================================================================
//
// Runs `body` every `interval` on its own thread until stop(). Restartable.
// stop() wakes the worker immediately rather than waiting out the interval.
//
class PeriodicTask {
public:
    using Body = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body);
    ~PeriodicTask();

    // Non-copyable
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Run one iteration on the calling thread
    void run_once();

    uint64_t iterations() const { return iterations_.load(std::memory_order_relaxed); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Body body_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> iterations_{0};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void worker_loop();
};

// =============================================================================
// ConfirmationMonitor - refunds pending transfers past their deadline
// =============================================================================
//
// The scan snapshots candidate ids without holding any pool lock, then asks
// the state machine to expire each one. A failure on one transfer is logged
// and retried on the next pass; it never stops the rest of the batch.
// Confirmed transfers are never timed out.
//
class ConfirmationMonitor {
public:
    ConfirmationMonitor(TransferMachine& transfers, const IClock& clock,
                        std::chrono::milliseconds interval);
    ~ConfirmationMonitor() { stop(); }

    // Non-copyable
    ConfirmationMonitor(const ConfirmationMonitor&) = delete;
    ConfirmationMonitor& operator=(const ConfirmationMonitor&) = delete;

    void start() { task_.start(); }
    void stop() { task_.stop(); }
    bool is_running() const { return task_.is_running(); }

    // One pass; returns the number of transfers refunded
    size_t scan();

    struct Stats {
        uint64_t scans;
        uint64_t refunded;
        uint64_t errors;
    };
    Stats get_stats() const;

private:
    TransferMachine& transfers_;
    const IClock& clock_;
    PeriodicTask task_;

    std::atomic<uint64_t> scans_{0};
    std::atomic<uint64_t> refunded_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace kald

#endif // KALD_MONITOR_HPP
