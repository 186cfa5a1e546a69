#pragma once
#include "ITranslationBackend.hpp"
#include <string>

// Hosted model behind an OpenAI-compatible chat completions endpoint.
class RemoteBackend : public ITranslationBackend {
public:
    struct Config {
        std::string host        = "https://api.openai.com";
        std::string path        = "/v1/chat/completions";
        std::string apiKey;
        std::string model       = "gpt-4o-mini";
        float       temperature = 0.1f;
        int         maxTokens   = 256;
    };

    explicit RemoteBackend(const Config& config) : config_(config) {}

    // No network check: usable whenever a key is configured.
    bool isAvailable() const override { return !config_.apiKey.empty(); }

    std::string complete(const std::string& systemPrompt,
                         const std::string& userPrompt,
                         int timeoutMs) const override;

    std::string backendName() const override { return "remote"; }

private:
    Config config_;
};
