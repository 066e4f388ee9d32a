#pragma once

#include <atomic>
#include <csignal>

namespace dirshift::infra {

// Signal number that stopped the run, 0 while running
extern std::atomic<int> g_interrupt_signal;

// SIGINT and SIGTERM only record themselves; jobs in flight finish and the
// coordinator stops before the next one.
void install_signal_handler();

inline auto is_interrupted() -> bool {
    return g_interrupt_signal.load(std::memory_order_relaxed) != 0;
}

inline auto interrupt_signal() -> int {
    return g_interrupt_signal.load(std::memory_order_relaxed);
}

// Shell convention: 128 + signal number (130 for Ctrl-C)
inline auto interrupt_exit_code() -> int {
    const int sig = interrupt_signal();
    return 128 + (sig != 0 ? sig : SIGINT);
}

inline void reset_interrupted(int sig = 0) {
    g_interrupt_signal.store(sig, std::memory_order_relaxed);
}

} // namespace dirshift::infra
