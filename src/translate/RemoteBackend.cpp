#include "translate/RemoteBackend.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

std::string RemoteBackend::complete(const std::string& systemPrompt,
                                    const std::string& userPrompt,
                                    int timeoutMs) const
{
    httplib::Client cli(config_.host);
    cli.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    cli.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);

    nlohmann::json body = {
        {"model",       config_.model},
        {"temperature", config_.temperature},
        {"max_tokens",  config_.maxTokens},
        {"response_format", {{"type", "json_object"}}},
        {"messages", {
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"},   {"content", userPrompt}}
        }}
    };

    httplib::Headers headers = {
        {"Authorization", "Bearer " + config_.apiKey}
    };

    auto res = cli.Post(config_.path, headers, body.dump(), "application/json");

    if (!res) {
        throw BackendError("Remote API request failed: " +
                           httplib::to_string(res.error()), true);
    }
    if (res->status != 200) {
        bool transient = res->status >= 500 || res->status == 429;
        throw BackendError("Remote API error " + std::to_string(res->status) +
                           ": " + res->body.substr(0, 200), transient);
    }

    try {
        auto j = nlohmann::json::parse(res->body);
        if (j.contains("choices") && j["choices"].is_array() &&
            !j["choices"].empty()) {
            auto& msg = j["choices"][0]["message"];
            if (msg.contains("content") && msg["content"].is_string())
                return msg["content"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(std::string("Remote API returned invalid JSON: ") +
                           e.what(), false);
    }
    throw BackendError("Remote API response has no message content", false);
}
