#include "exec/CommandExecutor.hpp"
#include "util/CommandLine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct StreamCapture {
    int         fd = -1;
    std::string text;
    size_t      total = 0;
    bool        truncated = false;

    // Returns false at EOF or on a read error.
    bool drain(size_t cap) {
        char buf[4096];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
        if (n <= 0) return false;

        total += static_cast<size_t>(n);
        if (text.size() < cap) {
            size_t keep = std::min(cap - text.size(), static_cast<size_t>(n));
            text.append(buf, keep);
            if (keep < static_cast<size_t>(n)) truncated = true;
        } else {
            truncated = true;
        }
        return true;
    }
};

} // namespace

std::optional<std::vector<std::string>> CommandExecutor::splitArgs(const std::string& command) {
    return splitCommandLine(command);
}

ExecutionResult CommandExecutor::execute(const std::string& command,
                                         const std::atomic<bool>* cancel) const
{
    ExecutionResult result;
    auto start = std::chrono::steady_clock::now();
    auto finish = [&]() {
        result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return result;
    };

    auto args = splitArgs(command);
    if (!args) {
        result.error = "Unterminated quote in command.";
        return finish();
    }
    if (args->empty() || (*args)[0] != config_.toolPrefix) {
        result.error = "Only " + config_.toolPrefix + " commands can be executed.";
        return finish();
    }
    (*args)[0] = config_.toolBinary;

    // argv is built before fork: the child may only make async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(args->size() + 1);
    for (auto& a : *args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int outPipe[2], errPipe[2], statusPipe[2];
    if (::pipe(outPipe) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        return finish();
    }
    if (::pipe(errPipe) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        ::close(outPipe[0]); ::close(outPipe[1]);
        return finish();
    }
    if (::pipe(statusPipe) != 0) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        return finish();
    }
    ::fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork: ") + std::strerror(errno);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1],
                       statusPipe[0], statusPipe[1]})
            ::close(fd);
        spdlog::error("Failed to spawn '{}': {}", command, result.error);
        return finish();
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(statusPipe[0]);
        if (devnull > STDERR_FILENO) ::close(devnull);

        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t w = ::write(statusPipe[1], &err, sizeof(err));
        (void)w;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(statusPipe[1]);

    // exec succeeded iff the CLOEXEC status pipe closes without data
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        if (execErrno == ENOENT) {
            result.error = config_.toolPrefix + " command not found. Please install " +
                           config_.toolPrefix + " and make sure it is on your PATH.";
        } else {
            result.error = "Failed to execute " + config_.toolBinary + ": " +
                           std::strerror(execErrno);
        }
        spdlog::error("Spawn failed for '{}': {}", command, result.error);
        return finish();
    }

    StreamCapture out, err;
    out.fd = outPipe[0];
    err.fd = errPipe[0];

    bool signalled = false;
    auto interruptAt = std::chrono::steady_clock::time_point{};
    bool killed = false;

    while (out.fd >= 0 || err.fd >= 0) {
        if (cancel && cancel->load() && !signalled) {
            spdlog::info("Interrupting pid {} (process group)", pid);
            ::kill(-pid, SIGINT);
            signalled   = true;
            interruptAt = std::chrono::steady_clock::now();
        }
        if (signalled && !killed &&
            std::chrono::steady_clock::now() - interruptAt >
                std::chrono::milliseconds(config_.killGraceMs)) {
            spdlog::warn("pid {} ignored SIGINT, sending SIGKILL", pid);
            ::kill(-pid, SIGKILL);
            killed = true;
        }

        struct pollfd fds[2];
        int count = 0;
        int outIdx = -1, errIdx = -1;
        if (out.fd >= 0) { fds[count] = {out.fd, POLLIN, 0}; outIdx = count++; }
        if (err.fd >= 0) { fds[count] = {err.fd, POLLIN, 0}; errIdx = count++; }

        int rc = ::poll(fds, count, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        if (outIdx >= 0 && (fds[outIdx].revents & (POLLIN | POLLHUP | POLLERR)))
            if (!out.drain(config_.outputCapBytes)) closeFd(out.fd);
        if (errIdx >= 0 && (fds[errIdx].revents & (POLLIN | POLLHUP | POLLERR)))
            if (!err.drain(config_.outputCapBytes)) closeFd(err.fd);
    }
    closeFd(out.fd);
    closeFd(err.fd);

    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}

    int code = 0;
    if (WIFEXITED(st))        code = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) code = 128 + WTERMSIG(st);

    result.exitCode    = code;
    result.success     = code == 0;
    result.interrupted = signalled;
    result.stdoutBytes = out.total;
    result.stderrBytes = err.total;
    result.stdoutText  = std::move(out.text);
    result.stderrText  = std::move(err.text);
    if (out.truncated) result.stdoutText += kTruncationMarker;
    if (err.truncated) result.stderrText += kTruncationMarker;

    finish();
    spdlog::info("'{}' exited with {} in {}ms", command, code, result.durationMs);
    return result;
}

std::string CommandExecutor::formatOutput(const ExecutionResult& result) {
    if (!result.error.empty())
        return "Error: " + result.error;

    std::string text;
    if (result.success) {
        text = result.stdoutText.empty() ? "(No output - command succeeded)"
                                         : result.stdoutText;
    } else {
        text = result.stdoutText;
        if (!result.stderrText.empty()) {
            if (!text.empty()) text += "\n";
            text += "Error: " + result.stderrText;
        }
        if (text.empty())
            text = "Command failed with exit code " +
                   std::to_string(result.exitCode.value_or(-1));
    }

    if (result.interrupted)
        text += "\n[Interrupted]";
    return text;
}
