// =================================================================
// src/Packwright/Cancellation.cpp
// =================================================================
// Implementation for interrupt handling and cancellation tokens.

#include "Packwright/Cancellation.hpp"
#include "Packwright/Errors.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace Packwright {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void onInterrupt(int) {
    g_interrupted = 1;
}

} // anonymous namespace

SignalGuard::SignalGuard() {
    struct sigaction action{};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, &m_previous_int);
    sigaction(SIGTERM, &action, &m_previous_term);
}

SignalGuard::~SignalGuard() {
    sigaction(SIGINT, &m_previous_int, nullptr);
    sigaction(SIGTERM, &m_previous_term, nullptr);
}

bool SignalGuard::interrupted() {
    return g_interrupted != 0;
}

void SignalGuard::reset() {
    g_interrupted = 0;
}

bool CancellationToken::isCancelled() const {
    return m_cancelled.load() || SignalGuard::interrupted();
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw Cancelled();
    }
}

bool CancellationToken::waitFor(long milliseconds) const {
    const long slice = 100;
    long remaining = milliseconds;
    while (remaining > 0) {
        if (isCancelled()) {
            return false;
        }
        long step = std::min(slice, remaining);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        remaining -= step;
    }
    return !isCancelled();
}

} // namespace Packwright
