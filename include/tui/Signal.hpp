#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Global flag flipped by SIGINT/SIGTERM so the main loop can restore the terminal.
extern std::atomic_bool g_interrupt_received;

// Installs handlers that only set the flag (async-signal-safe).
void InitInterruptHandlers();

#endif // TUI_SIGNAL_HPP
