#include "tui/Signal.hpp"

#include <csignal>

std::atomic_bool g_interrupt_received{false};

static void InterruptHandler(int) {
    g_interrupt_received.store(true, std::memory_order_relaxed);
}

void InitInterruptHandlers() {
    g_interrupt_received.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = InterruptHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}
