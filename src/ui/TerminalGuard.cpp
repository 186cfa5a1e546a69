#include "ui/TerminalGuard.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <unistd.h>

struct termios TerminalGuard::saved_{};
volatile int   TerminalGuard::haveSaved_ = 0;

namespace {

constexpr int kFatalSignals[] = {
    SIGSEGV, SIGABRT, SIGFPE, SIGILL, SIGBUS, SIGTERM, SIGHUP, SIGQUIT
};

std::terminate_handler previousTerminate = nullptr;

} // namespace

TerminalGuard::TerminalGuard() {
    if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved_) == 0)
        haveSaved_ = 1;
    else
        spdlog::debug("stdin is not a terminal; nothing to restore");

    for (int sig : kFatalSignals) {
        struct sigaction sa{};
        sa.sa_handler = &TerminalGuard::onFatalSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESETHAND;
        ::sigaction(sig, &sa, nullptr);
    }
    previousTerminate = std::set_terminate(&TerminalGuard::onTerminate);
}

TerminalGuard::~TerminalGuard() {
    restore();
    for (int sig : kFatalSignals) std::signal(sig, SIG_DFL);
    std::set_terminate(previousTerminate);
    haveSaved_ = 0;
}

void TerminalGuard::restore() noexcept {
    static const char reset[] = "\x1b[?1049l\x1b[?25h";
    if (::isatty(STDOUT_FILENO)) {
        ssize_t n = ::write(STDOUT_FILENO, reset, sizeof(reset) - 1);
        (void)n;
    }
    if (haveSaved_)
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
}

bool TerminalGuard::active() {
    return haveSaved_ != 0;
}

void TerminalGuard::onFatalSignal(int sig) {
    restore();
    // SA_RESETHAND already put the default action back
    ::raise(sig);
}

void TerminalGuard::onTerminate() {
    restore();
    if (previousTerminate) previousTerminate();
    std::abort();
}
