#include "translate/OllamaBackend.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

bool OllamaBackend::isAvailable() const {
    httplib::Client cli(config_.host);
    cli.set_connection_timeout(0, 500000);
    cli.set_read_timeout(1, 0);

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        spdlog::debug("Ollama not reachable at {}", config_.host);
        return false;
    }
    return true;
}

std::string OllamaBackend::complete(const std::string& systemPrompt,
                                    const std::string& userPrompt,
                                    int timeoutMs) const
{
    httplib::Client cli(config_.host);
    cli.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    cli.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);

    nlohmann::json body = {
        {"model",   config_.model},
        {"stream",  false},
        {"format",  "json"},
        {"system",  systemPrompt},
        {"prompt",  userPrompt},
        {"options", {
            {"temperature", config_.temperature},
            {"num_predict", config_.maxTokens}
        }}
    };

    auto res = cli.Post("/api/generate", body.dump(), "application/json");

    if (!res) {
        throw BackendError("Ollama request failed: " +
                           httplib::to_string(res.error()), true);
    }
    if (res->status != 200) {
        bool transient = res->status >= 500 || res->status == 429;
        throw BackendError("Ollama API error " + std::to_string(res->status) +
                           ": " + res->body.substr(0, 200), transient);
    }

    try {
        auto j = nlohmann::json::parse(res->body);
        return j.value("response", "");
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(std::string("Ollama returned invalid JSON: ") +
                           e.what(), false);
    }
}
