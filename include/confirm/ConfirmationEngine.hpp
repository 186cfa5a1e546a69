#pragma once
#include "ConfirmationDialog.hpp"
#include "KeyEvent.hpp"
#include "audit/AuditLog.hpp"
#include "context/EnvironmentContext.hpp"
#include "context/EnvironmentResolver.hpp"
#include "exec/CommandExecutor.hpp"
#include "safety/Allowlist.hpp"
#include "safety/RiskClassifier.hpp"
#include "translate/Translator.hpp"
#include "util/BackgroundTask.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class EngineState {
    Normal,       // accepting input
    Translating,  // backend call in flight
    ModalActive,  // waiting for a confirmation choice
    Executing,    // child process running
    Done          // request finished; becomes Normal on the next tick
};

inline const char* engineStateToString(EngineState s) {
    switch (s) {
        case EngineState::Normal:      return "normal";
        case EngineState::Translating: return "translating";
        case EngineState::ModalActive: return "confirm";
        case EngineState::Executing:   return "executing";
        case EngineState::Done:        return "done";
    }
    return "normal";
}

struct EngineConfig {
    int         confidenceThreshold = 70;
    std::string toolPrefix          = "kubectl";
    size_t      historyPageSize     = 20;
    int         watchdogGraceMs     = 2000;   // on top of the translator timeout
};

// A command on its way to execution, with everything the audit entry needs.
struct Proposal {
    std::string                naturalLanguage;
    std::string                command;
    std::optional<std::string> originalCommand;   // AI proposal, when edited
    std::optional<int>         confidence;        // null for direct entry
    std::string                rationale;
    RiskLevel                  risk = RiskLevel::Low;
    EnvironmentContext         context;           // snapshot at submission
    bool                       lowConfidence = false;

    bool edited() const { return originalCommand && *originalCommand != command; }
};

// Drives one session: input line, translation, risk gating, confirmation,
// execution and audit. Single-threaded; blocking work runs in
// BackgroundTasks that tick() polls. Every request that reaches a
// terminal outcome writes exactly one audit entry.
class ConfirmationEngine {
public:
    ConfirmationEngine(const EngineConfig& config,
                       std::shared_ptr<const Translator> translator,
                       const RiskClassifier& classifier,
                       Allowlist& allowlist,
                       AuditLog& audit,
                       std::shared_ptr<const CommandExecutor> executor,
                       EnvironmentContext context,
                       const EnvironmentResolver* resolver = nullptr);

    void handleKey(const KeyEvent& key);

    // Submits the current input line.
    void submit();

    // Called every loop iteration: collects finished tasks and runs the
    // translation watchdog.
    void tick();

    // Signals any running translation or execution to stop. Called once
    // the loop has exited; the workers are then awaited through
    // BackgroundWorkers.
    void shutdown();

    // View state
    EngineState               state() const { return state_; }
    const std::string&        input() const { return input_; }
    const EnvironmentContext& context() const { return context_; }
    const ConfirmationDialog* dialog() const { return dialog_ ? &*dialog_ : nullptr; }
    const Proposal*           proposal() const { return current_ ? &*current_ : nullptr; }
    const std::string&        output() const { return output_; }
    const std::string&        banner() const { return banner_; }
    const std::string&        notice() const { return notice_; }
    bool                      editing() const { return editing_.has_value(); }
    bool                      quitRequested() const { return quitRequested_; }
    int                       auditFailures() const { return auditFailures_; }
    long long                 activityElapsedMs() const;

    void setInput(std::string text) { input_ = std::move(text); }

    static std::string helpText();

private:
    void handleNormalKey(const KeyEvent& key);
    void handleModalKey(const KeyEvent& key);

    bool runBuiltin(const std::string& line);
    void startTranslation(const std::string& text);
    void onTranslation(const TranslationOutcome& outcome);
    void beginProposal(Proposal proposal);
    void startExecution();
    void onExecution(const ExecutionResult& result);
    void abandonEdit();
    void cancelProposal(const std::string& why);
    void record(const Proposal& p, UserAction action, const ExecutionResult* result);
    void finish();

    EngineConfig config_;
    std::shared_ptr<const Translator>      translator_;
    const RiskClassifier&                  classifier_;
    Allowlist&                             allowlist_;
    AuditLog&                              audit_;
    std::shared_ptr<const CommandExecutor> executor_;
    EnvironmentContext                     context_;
    const EnvironmentResolver*             resolver_;

    EngineState state_ = EngineState::Normal;
    std::string input_;
    std::string output_;
    std::string banner_;
    std::string notice_;
    bool        quitRequested_ = false;
    int         auditFailures_ = 0;

    std::optional<Proposal>           current_;
    std::optional<Proposal>           editing_;    // proposal being edited
    std::optional<ConfirmationDialog> dialog_;
    std::string                       pendingText_;  // request being translated

    BackgroundTask<TranslationOutcome> translation_;
    BackgroundTask<ExecutionResult>    execution_;
};
