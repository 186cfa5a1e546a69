#include "translate/Translator.hpp"
#include "translate/ResponseParser.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

} // namespace

Translator::Translator(const TranslatorConfig& config,
                       std::vector<std::unique_ptr<ITranslationBackend>> backends)
    : config_(config)
    , prompts_(config.toolPrefix, config.operations)
    , backends_(std::move(backends))
{}

std::string Translator::validateRequest(const std::string& text) const {
    auto t = trim(text);
    if (t.empty())
        return "Please enter a request.";
    if (t.size() > config_.maxRequestLength)
        return "Request is too long (max " +
               std::to_string(config_.maxRequestLength) + " characters).";
    return "";
}

TranslationOutcome Translator::translate(const TranslationRequest& request,
                                         const std::atomic<bool>* cancel) const
{
    auto invalid = validateRequest(request.text);
    if (!invalid.empty())
        return TranslationOutcome::failure(TranslationError::InvalidRequest, invalid);

    totalCalls_++;
    auto start    = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds(config_.timeoutMs);

    auto remainingMs = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
    };
    auto elapsedMs = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    const std::string systemPrompt = prompts_.buildSystemPrompt(request.context);
    const std::string userPrompt   = prompts_.buildUserPrompt(trim(request.text),
                                                              request.context);

    std::string lastError = "no translation backend configured";

    for (auto& backend : backends_) {
        if (cancelled(cancel) || remainingMs() <= 0) break;

        if (!backend->isAvailable()) {
            spdlog::info("Backend {} unavailable, trying next", backend->backendName());
            lastError = backend->backendName() + " unavailable";
            continue;
        }

        for (int attempt = 0; attempt <= config_.maxRetries; attempt++) {
            if (cancelled(cancel)) break;
            auto budget = remainingMs();
            if (budget <= 0) {
                lastError = "timed out";
                break;
            }

            std::string raw;
            try {
                raw = backend->complete(systemPrompt, userPrompt,
                                        static_cast<int>(budget));
            } catch (const BackendError& e) {
                lastError = e.what();
                if (e.transient() && attempt < config_.maxRetries) {
                    spdlog::warn("{} transient failure, retrying: {}",
                                 backend->backendName(), e.what());
                    continue;
                }
                spdlog::warn("{} failed: {}", backend->backendName(), e.what());
                break;
            }

            auto outcome = parseTranslationResponse(raw, config_.toolPrefix);
            outcome.backend   = backend->backendName();
            outcome.latencyMs = elapsedMs();
            totalLatencyMs_ += outcome.latencyMs;

            if (!outcome.ok) {
                failedCalls_++;
                spdlog::warn("Malformed response from {}: {}",
                             outcome.backend, outcome.message);
                return outcome;
            }

            spdlog::info("Translated via {} in {}ms (confidence {})",
                         outcome.backend, outcome.latencyMs,
                         outcome.result.confidence);
            return outcome;
        }
    }

    failedCalls_++;
    totalLatencyMs_ += elapsedMs();

    if (cancelled(cancel)) {
        spdlog::info("Translation cancelled after {}ms", elapsedMs());
        return TranslationOutcome::failure(TranslationError::Unavailable,
            "Translation cancelled.");
    }

    spdlog::error("All translation backends failed: {}", lastError);
    return TranslationOutcome::failure(TranslationError::Unavailable,
        "Translation service unavailable. Enter a kubectl command directly.");
}

float Translator::avgLatencyMs() const {
    int calls = totalCalls_;
    return calls > 0 ? static_cast<float>(totalLatencyMs_) / calls : 0.0f;
}
