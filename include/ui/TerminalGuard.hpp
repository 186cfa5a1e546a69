#pragma once
#include <termios.h>

// Owns the terminal mode for the lifetime of the process: snapshots the
// termios settings on construction and puts them back on destruction,
// on std::terminate, and from a handler for fatal signals (which then
// re-raises the signal with its default action).
//
// Only one instance may exist at a time.
class TerminalGuard {
public:
    TerminalGuard();
    ~TerminalGuard();

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

    // Async-signal-safe: leaves the alternate screen, shows the cursor
    // and restores the saved termios.
    static void restore() noexcept;

    static bool active();

private:
    static void onFatalSignal(int sig);
    static void onTerminate();

    static struct termios saved_;
    static volatile int   haveSaved_;
};
