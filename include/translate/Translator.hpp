#pragma once
#include "ITranslationBackend.hpp"
#include "PromptBuilder.hpp"
#include "TranslationTypes.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

struct TranslatorConfig {
    int         timeoutMs        = 10000;  // hard budget for one translate()
    int         maxRetries       = 1;      // transient failures only
    size_t      maxRequestLength = 500;
    std::string toolPrefix       = "kubectl";
    std::vector<std::string> operations;
};

// Natural language -> proposed command. Backends are tried in order
// (local first, remote second); a backend that is unreachable or errors
// hands over to the next one. Safe to call from a worker thread: the
// only mutable state is the atomic stats.
class Translator {
public:
    Translator(const TranslatorConfig& config,
               std::vector<std::unique_ptr<ITranslationBackend>> backends);

    // Never throws. `cancel` is checked between backend attempts.
    TranslationOutcome translate(const TranslationRequest& request,
                                 const std::atomic<bool>* cancel = nullptr) const;

    // Validates request length before any backend call.
    std::string validateRequest(const std::string& text) const;

    const TranslatorConfig& config() const { return config_; }
    size_t backendCount() const { return backends_.size(); }

    // Stats
    int totalCalls() const { return totalCalls_; }
    int failedCalls() const { return failedCalls_; }
    float avgLatencyMs() const;

private:
    TranslatorConfig config_;
    PromptBuilder prompts_;
    std::vector<std::unique_ptr<ITranslationBackend>> backends_;

    mutable std::atomic<int>       totalCalls_{0};
    mutable std::atomic<int>       failedCalls_{0};
    mutable std::atomic<long long> totalLatencyMs_{0};
};
