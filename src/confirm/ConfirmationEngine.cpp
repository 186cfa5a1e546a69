#include "confirm/ConfirmationEngine.hpp"
#include "audit/AuditFormatter.hpp"
#include "util/Utf8.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

using Kind = KeyEvent::Kind;

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> words(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> out;
    std::string w;
    while (in >> w) out.push_back(w);
    return out;
}

} // namespace

ConfirmationEngine::ConfirmationEngine(const EngineConfig& config,
                                       std::shared_ptr<const Translator> translator,
                                       const RiskClassifier& classifier,
                                       Allowlist& allowlist,
                                       AuditLog& audit,
                                       std::shared_ptr<const CommandExecutor> executor,
                                       EnvironmentContext context,
                                       const EnvironmentResolver* resolver)
    : config_(config)
    , translator_(std::move(translator))
    , classifier_(classifier)
    , allowlist_(allowlist)
    , audit_(audit)
    , executor_(std::move(executor))
    , context_(std::move(context))
    , resolver_(resolver)
{}

// ── Input ────────────────────────────────────────────────────────

void ConfirmationEngine::handleKey(const KeyEvent& key) {
    switch (state_) {
        case EngineState::Normal:
        case EngineState::Done:
            handleNormalKey(key);
            return;

        case EngineState::ModalActive:
            handleModalKey(key);
            return;

        case EngineState::Translating:
            if (key.kind == Kind::Interrupt || key.kind == Kind::Escape) {
                translation_.cancel();
                state_  = EngineState::Normal;
                notice_ = "Translation cancelled.";
                spdlog::info("Translation cancelled by operator");
                return;
            }
            if (key.kind == Kind::Enter) {
                submit();
                return;
            }
            if (key.kind == Kind::Character) input_ += key.text;
            else if (key.kind == Kind::Backspace) popUtf8(input_);
            return;

        case EngineState::Executing:
            if (key.kind == Kind::Interrupt) {
                execution_.requestStop();
                notice_ = "Interrupting command...";
                return;
            }
            if (key.kind == Kind::Enter) submit();
            return;
    }
}

void ConfirmationEngine::handleNormalKey(const KeyEvent& key) {
    switch (key.kind) {
        case Kind::Character:
            input_ += key.text;
            break;
        case Kind::Backspace:
            popUtf8(input_);
            break;
        case Kind::Enter:
            submit();
            break;
        case Kind::Escape:
            if (editing_) abandonEdit();
            input_.clear();
            break;
        case Kind::Interrupt:
            if (editing_) {
                abandonEdit();
                input_.clear();
            } else if (!input_.empty()) {
                input_.clear();
            } else {
                quitRequested_ = true;
            }
            break;
        case Kind::EndOfInput:
            if (input_.empty() && !editing_) quitRequested_ = true;
            break;
        default:
            break;
    }
}

void ConfirmationEngine::handleModalKey(const KeyEvent& key) {
    if (!dialog_ || !current_) {
        state_ = EngineState::Normal;
        return;
    }

    switch (dialog_->handleKey(key)) {
        case ConfirmationDialog::Choice::Pending:
            return;

        case ConfirmationDialog::Choice::AllowOnce:
            startExecution();
            return;

        case ConfirmationDialog::Choice::AllowAlways:
            if (allowlist_.add(current_->command))
                notice_ = "Added to allowlist.";
            else
                notice_ = "Could not save to the allowlist; running once.";
            startExecution();
            return;

        case ConfirmationDialog::Choice::Deny:
            cancelProposal(dialog_->mismatch()
                ? "Confirmation text did not match. Command cancelled."
                : "Command cancelled.");
            return;

        case ConfirmationDialog::Choice::Edit:
            editing_ = *current_;
            input_   = current_->command;
            current_.reset();
            dialog_.reset();
            state_  = EngineState::Normal;
            notice_ = "Edit the command and press Enter to check it again. Esc discards it.";
            return;
    }
}

void ConfirmationEngine::submit() {
    if (state_ == EngineState::Translating || state_ == EngineState::Executing) {
        notice_ = "Still processing the previous request. Press Ctrl-C to cancel it.";
        return;
    }
    if (state_ == EngineState::ModalActive) return;

    std::string line = trim(input_);
    if (line.empty()) return;

    input_.clear();
    notice_.clear();
    banner_.clear();
    state_ = EngineState::Normal;

    const std::string prefix = config_.toolPrefix + " ";
    bool direct = line.rfind(prefix, 0) == 0;

    if (editing_) {
        if (direct) {
            Proposal p = *editing_;
            p.originalCommand = editing_->originalCommand.value_or(editing_->command);
            p.command = line;
            editing_.reset();
            beginProposal(std::move(p));
            return;
        }
        abandonEdit();
    }

    if (runBuiltin(line)) return;

    if (direct) {
        Proposal p;
        p.naturalLanguage = line;
        p.command         = line;
        p.context         = context_;
        beginProposal(std::move(p));
        return;
    }

    startTranslation(line);
}

// ── Built-ins ────────────────────────────────────────────────────

bool ConfirmationEngine::runBuiltin(const std::string& line) {
    auto args = words(line);
    if (args.empty()) return false;
    const std::string& cmd = args[0];

    if (cmd == "exit" || cmd == "quit") {
        if (args.size() != 1) return false;
        quitRequested_ = true;
        return true;
    }

    if (cmd == "help" && args.size() == 1) {
        output_ = helpText();
        return true;
    }

    if (cmd == "clear" && args.size() == 1) {
        output_.clear();
        return true;
    }

    if (cmd == "history") {
        std::string error;
        auto filter = AuditFormatter::parseHistoryArgs(
            std::vector<std::string>(args.begin() + 1, args.end()),
            config_.historyPageSize, error);
        if (!filter) {
            notice_ = error;
            return true;
        }
        output_ = AuditFormatter::formatTable(audit_.query(*filter));
        return true;
    }

    if (cmd == "use-context") {
        if (!resolver_) {
            notice_ = "Context switching is not available in this session.";
            return true;
        }
        try {
            if (args.size() == 1) {
                std::string list = "Contexts:\n";
                for (auto& name : resolver_->listContexts())
                    list += (name == context_.name ? "* " : "  ") + name + "\n";
                output_ = list;
                return true;
            }
            context_ = resolver_->resolveContext(args[1]);
            output_  = "Switched to context " + context_.name + " (" +
                       environmentClassToString(context_.environmentClass) +
                       ", namespace " + context_.effectiveNamespace() + ")";
        } catch (const ConfigurationError& e) {
            notice_ = e.what();
        }
        return true;
    }

    if (cmd == "allowlist") {
        if (args.size() == 1) {
            if (allowlist_.size() == 0) {
                output_ = "Allowlist is empty.";
            } else {
                std::string list = "Allowlisted commands:\n";
                for (auto& entry : allowlist_.entries()) list += "  " + entry + "\n";
                output_ = list;
            }
            return true;
        }
        if (args[1] == "remove" && args.size() > 2) {
            auto pos = line.find("remove");
            std::string target = trim(line.substr(pos + 6));
            if (allowlist_.remove(target))
                output_ = "Removed from allowlist: " + target;
            else
                notice_ = "Not in allowlist: " + target;
            return true;
        }
        notice_ = "Usage: allowlist | allowlist remove <command>";
        return true;
    }

    return false;
}

std::string ConfirmationEngine::helpText() {
    return
        "Type a request in plain language, or a kubectl command directly.\n"
        "\n"
        "Built-in commands:\n"
        "  history [today|week|<N>d|env <name>] [page]  show the audit trail\n"
        "  use-context [name]                           list or switch kube contexts\n"
        "  allowlist                                    list always-allowed commands\n"
        "  allowlist remove <command>                   remove an allowlisted command\n"
        "  clear                                        clear the output pane\n"
        "  help                                         this text\n"
        "  exit | quit                                  leave\n"
        "\n"
        "Confirmation: y/n/a (always), Tab/arrows + Enter, e or Ctrl-E to edit, Esc cancels.\n"
        "Ctrl-C cancels a running translation or interrupts a running command.";
}

// ── Translation ──────────────────────────────────────────────────

void ConfirmationEngine::startTranslation(const std::string& text) {
    if (!translator_) {
        input_  = config_.toolPrefix + " ";
        notice_ = "Translation service unavailable. Enter a kubectl command directly.";
        return;
    }

    auto invalid = translator_->validateRequest(text);
    if (!invalid.empty()) {
        notice_ = invalid;
        return;
    }

    pendingText_ = text;
    state_       = EngineState::Translating;

    TranslationRequest request{text, context_};
    auto translator = translator_;
    translation_.start([translator, request](const std::atomic<bool>& cancel) {
        return translator->translate(request, &cancel);
    });
    spdlog::debug("Translation started for '{}'", text);
}

void ConfirmationEngine::onTranslation(const TranslationOutcome& outcome) {
    state_ = EngineState::Normal;

    if (outcome.ok) {
        const auto& r = outcome.result;
        if (r.needsClarification()) {
            input_  = r.command;
            notice_ = "Need more detail: " + r.clarificationQuestion() +
                      " Edit the command or rephrase the request.";
            return;
        }

        Proposal p;
        p.naturalLanguage = pendingText_;
        p.command         = r.command;
        p.confidence      = r.confidence;
        p.rationale       = r.rationale;
        p.context         = context_;
        beginProposal(std::move(p));
        return;
    }

    switch (outcome.error) {
        case TranslationError::Unavailable:
            input_  = config_.toolPrefix + " ";
            notice_ = outcome.message;
            break;
        case TranslationError::Malformed:
            notice_ = outcome.message;
            if (!outcome.rationale.empty())
                notice_ += " AI rationale: " + outcome.rationale;
            notice_ += " Rephrase the request or type a kubectl command.";
            break;
        default:
            notice_ = outcome.message;
            break;
    }
}

// ── Gating ───────────────────────────────────────────────────────

void ConfirmationEngine::beginProposal(Proposal proposal) {
    proposal.risk = classifier_.classify(proposal.command,
                                         proposal.context.environmentClass);
    proposal.lowConfidence = proposal.confidence &&
                             *proposal.confidence < config_.confidenceThreshold;

    if (proposal.lowConfidence) {
        banner_ = "Low confidence (" + std::to_string(*proposal.confidence) +
                  "%): review the command before running it.";
        if (!proposal.rationale.empty()) banner_ += " " + proposal.rationale;
    }

    spdlog::info("Proposed '{}' risk={} confidence={}", proposal.command,
                 riskLevelToString(proposal.risk),
                 proposal.confidence ? std::to_string(*proposal.confidence) : "-");

    current_ = std::move(proposal);
    dialog_.reset();

    if (current_->risk == RiskLevel::Low) {
        startExecution();
        return;
    }
    if (allowlist_.isAllowed(current_->command)) {
        notice_ = "Allowlisted command, running without confirmation.";
        startExecution();
        return;
    }

    dialog_.emplace(current_->command, current_->risk,
                    ConfirmationSpec::derive(current_->command, current_->risk,
                                             current_->context.environmentClass));
    state_ = EngineState::ModalActive;
}

void ConfirmationEngine::cancelProposal(const std::string& why) {
    record(*current_, UserAction::Cancelled, nullptr);
    output_ = why;
    finish();
}

void ConfirmationEngine::abandonEdit() {
    if (!editing_) return;
    record(*editing_, UserAction::Cancelled, nullptr);
    notice_ = "Edit discarded. Command cancelled.";
    editing_.reset();
}

// ── Execution ────────────────────────────────────────────────────

void ConfirmationEngine::startExecution() {
    dialog_.reset();
    state_  = EngineState::Executing;
    output_.clear();

    auto executor = executor_;
    std::string command = current_->command;
    execution_.start([executor, command](const std::atomic<bool>& cancel) {
        return executor->execute(command, &cancel);
    });
}

void ConfirmationEngine::onExecution(const ExecutionResult& result) {
    auto action = current_->edited() ? UserAction::Edited : UserAction::Executed;
    record(*current_, action, &result);

    output_ = "$ " + current_->command + "\n" + CommandExecutor::formatOutput(result);

    if (!result.error.empty())
        notice_ = "The command could not be run. Edit it or try another request.";
    else if (result.interrupted)
        notice_ = "Command interrupted.";
    else if (!result.success)
        notice_ = "Command exited with code " +
                  std::to_string(result.exitCode.value_or(-1)) + ".";
    finish();
}

// ── Loop ─────────────────────────────────────────────────────────

void ConfirmationEngine::tick() {
    switch (state_) {
        case EngineState::Done:
            state_ = EngineState::Normal;
            return;

        case EngineState::Translating: {
            std::optional<TranslationOutcome> outcome;
            try {
                outcome = translation_.poll();
            } catch (const std::exception& e) {
                spdlog::error("Translation task failed: {}", e.what());
                outcome = TranslationOutcome::failure(TranslationError::Unavailable,
                    "Translation failed. Enter a kubectl command directly.");
            }
            if (outcome) {
                onTranslation(*outcome);
                return;
            }

            // The translator bounds itself; this only catches a stuck backend
            long long limit = translator_->config().timeoutMs + config_.watchdogGraceMs;
            if (translation_.elapsedMs() > limit) {
                spdlog::warn("Translation exceeded {}ms, abandoning it", limit);
                translation_.cancel();
                onTranslation(TranslationOutcome::failure(TranslationError::Unavailable,
                    "Translation timed out. Enter a kubectl command directly."));
            }
            return;
        }

        case EngineState::Executing: {
            std::optional<ExecutionResult> result;
            try {
                result = execution_.poll();
            } catch (const std::exception& e) {
                spdlog::error("Execution task failed: {}", e.what());
                result = ExecutionResult{};
                result->error = e.what();
            }
            if (result) onExecution(*result);
            return;
        }

        default:
            return;
    }
}

void ConfirmationEngine::shutdown() {
    if (translation_.active() || execution_.active())
        spdlog::info("Stopping background work before exit");
    translation_.cancel();
    execution_.cancel();
}

void ConfirmationEngine::finish() {
    dialog_.reset();
    state_ = EngineState::Done;
}

long long ConfirmationEngine::activityElapsedMs() const {
    if (state_ == EngineState::Translating) return translation_.elapsedMs();
    if (state_ == EngineState::Executing)   return execution_.elapsedMs();
    return 0;
}

// ── Audit ────────────────────────────────────────────────────────

void ConfirmationEngine::record(const Proposal& p, UserAction action,
                                const ExecutionResult* result)
{
    AuditLogEntry e;
    e.userId               = AuditLog::currentUser();
    e.naturalLanguageInput = p.naturalLanguage;
    e.finalCommand         = p.command;
    if (p.edited()) e.originalCommand = p.originalCommand;
    e.confidence           = p.confidence;
    e.riskLevel            = p.risk;
    e.environmentName      = p.context.name;
    e.cluster              = p.context.cluster;
    e.namespaceName        = p.context.namespaceName;
    e.userAction           = action;

    if (result) {
        e.exitCode   = result->exitCode;
        e.stdoutText = result->stdoutText;
        e.stderrText = result->error.empty() ? result->stderrText : result->error;
        e.durationMs = result->durationMs;
    }

    // Failure is logged by AuditLog; execution carries on regardless
    auto written = audit_.record(e);
    if (!written.ok) auditFailures_++;
}
