#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <vector>

struct ExecutorConfig {
    std::string toolPrefix     = "kubectl";  // first word every command must have
    std::string toolBinary     = "kubectl";  // what actually gets exec'd for it
    size_t      outputCapBytes = 10240;      // per stream
    int         killGraceMs    = 3000;       // SIGINT -> SIGKILL
};

struct ExecutionResult {
    bool               success = false;
    std::optional<int> exitCode;             // empty when nothing was spawned
    std::string        stdoutText;
    std::string        stderrText;
    long long          durationMs = 0;
    std::string        error;                // spawn failure / rejected command
    bool               interrupted = false;
    size_t             stdoutBytes = 0;      // total seen, including dropped
    size_t             stderrBytes = 0;

    bool spawned() const { return exitCode.has_value(); }
};

// Runs one approved command as a child process in its own process group.
// Never retries. Output beyond the cap is drained and dropped, and the
// kept text ends with the truncation marker.
class CommandExecutor {
public:
    static constexpr const char* kTruncationMarker = "\n\n[OUTPUT TRUNCATED]";

    explicit CommandExecutor(const ExecutorConfig& config = {}) : config_(config) {}

    // Blocks until the child exits. Setting *cancel sends SIGINT to the
    // child's process group.
    ExecutionResult execute(const std::string& command,
                            const std::atomic<bool>* cancel = nullptr) const;

    // The argv execute() would run; see splitCommandLine.
    static std::optional<std::vector<std::string>> splitArgs(const std::string& command);

    // Text shown to the operator for a finished command.
    static std::string formatOutput(const ExecutionResult& result);

    const ExecutorConfig& config() const { return config_; }

private:
    ExecutorConfig config_;
};
