// signals.cpp - Ctrl-C / SIGTERM stop a check between images.

#include "system/signals.hpp"

#include <csignal>

namespace updock {

std::atomic_bool g_cancel{false};

namespace {

// Images already being fetched finish; the rest are reported as cancelled.
// A second signal is not caught, so it terminates a run stuck on the network.
void RequestCancel(int sig) {
    g_cancel.store(true, std::memory_order_relaxed);
    std::signal(sig, SIG_DFL);
}

} // namespace

void InstallSignalHandlers() {
    std::signal(SIGINT, RequestCancel);
    std::signal(SIGTERM, RequestCancel);
}

} // namespace updock
