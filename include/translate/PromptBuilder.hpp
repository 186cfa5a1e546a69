#pragma once
#include "context/EnvironmentContext.hpp"
#include <string>
#include <vector>

// Builds the system/user prompt pair sent to every backend.
class PromptBuilder {
public:
    PromptBuilder(std::string toolPrefix, std::vector<std::string> operations)
        : toolPrefix_(std::move(toolPrefix)), operations_(std::move(operations)) {}

    std::string buildSystemPrompt(const EnvironmentContext& ctx) const;
    std::string buildUserPrompt(const std::string& input,
                                const EnvironmentContext& ctx) const;

    const std::vector<std::string>& operations() const { return operations_; }

private:
    std::string toolPrefix_;
    std::vector<std::string> operations_;
};
