#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>

/**
 * Operator interrupt tracking for the batch run.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM
 * - Signals are only recorded; the orchestrator polls between jobs
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Programmatically request shutdown (not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    // Also picks up a signal delivered since the last call
    bool isShutdownRequested() noexcept;

    // Predicate suitable for BatchOrchestrator
    std::function<bool()> cancellationCheck();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
