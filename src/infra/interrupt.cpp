#include "interrupt.hpp"

#include <cstring>

namespace dirshift::infra {

std::atomic<int> g_interrupt_signal{0};

namespace {

void record_signal(int sig) {
    int expected = 0;
    // First signal wins; a second Ctrl-C does not overwrite it
    g_interrupt_signal.compare_exchange_strong(expected, sig, std::memory_order_relaxed);
}

} // namespace

void install_signal_handler() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = record_signal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a pending prompt read returns so the flag is seen early
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace dirshift::infra
