#pragma once

#include <atomic>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>
#include "core/cancellation_token.hpp"

/**
 * Process-wide interruption handling for the command line.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM
 * - A signal cancels the shared CancellationToken, so a running query stops at its
 *   next external call instead of the process being killed mid-write
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request shutdown (safe to call from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Token cancelled when shutdown is requested
    const CancellationToken &cancellationToken() const { return token_; }

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    CancellationToken token_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
