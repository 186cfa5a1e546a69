#pragma once
#include "ITranslationBackend.hpp"
#include <string>

// Local inference through an Ollama server (POST /api/generate).
class OllamaBackend : public ITranslationBackend {
public:
    struct Config {
        std::string host        = "http://localhost:11434";
        std::string model       = "llama3:8b";
        float       temperature = 0.1f;
        int         maxTokens   = 256;
    };

    explicit OllamaBackend(const Config& config) : config_(config) {}

    // GET /api/tags with a short timeout.
    bool isAvailable() const override;

    std::string complete(const std::string& systemPrompt,
                         const std::string& userPrompt,
                         int timeoutMs) const override;

    std::string backendName() const override { return "ollama"; }

private:
    Config config_;
};
