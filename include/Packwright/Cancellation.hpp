// =================================================================
// include/Packwright/Cancellation.hpp
// =================================================================
// Cooperative cancellation driven by user interrupts.

#pragma once

#include <atomic>
#include <csignal>

namespace Packwright {

/**
 * @brief Installs SIGINT/SIGTERM handlers for the lifetime of the guard
 *
 * The handler only records that an interrupt arrived; long running work
 * observes it through a CancellationToken.
 */
class SignalGuard {
public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    /**
     * @brief True once an interrupt has been received
     */
    static bool interrupted();

    /**
     * @brief Clear the interrupt flag
     */
    static void reset();

private:
    struct sigaction m_previous_int;
    struct sigaction m_previous_term;
};

/**
 * @brief Shared flag polled by supervisors, downloads and polling loops
 */
class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { m_cancelled.store(true); }

    /**
     * @brief True when cancel() was called or an interrupt was received
     */
    bool isCancelled() const;

    /**
     * @throws Cancelled when the token has been tripped
     */
    void throwIfCancelled() const;

    /**
     * @brief Sleep up to the given time, waking early on cancellation
     * @return false if cancelled while waiting
     */
    bool waitFor(long milliseconds) const;

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace Packwright
