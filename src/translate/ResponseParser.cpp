#include "translate/ResponseParser.hpp"
#include "util/CommandLine.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

TranslationOutcome parseTranslationResponse(const std::string& raw,
                                            const std::string& toolPrefix)
{
    auto start = raw.find('{');
    auto end   = raw.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        spdlog::warn("Translation response contains no JSON object");
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI response was not in the expected format.");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(raw.substr(start, end - start + 1));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse translation JSON: {}", e.what());
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI response could not be parsed.");
    }

    std::string rationale;
    if (j.contains("rationale") && j["rationale"].is_string())
        rationale = j["rationale"].get<std::string>();
    else if (j.contains("reasoning") && j["reasoning"].is_string())
        rationale = j["reasoning"].get<std::string>();

    if (!j.contains("command") || !j["command"].is_string()) {
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI response did not include a command.", rationale);
    }
    std::string command = trim(j["command"].get<std::string>());

    // A second line would run as its own command if the text were ever
    // re-read line by line (allowlist file, shell history)
    if (containsControlChars(command)) {
        spdlog::warn("Translation proposed a command with control characters");
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI proposed a command containing control characters.", rationale);
    }

    if (command.rfind(toolPrefix + " ", 0) != 0) {
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI proposed a command that does not start with '" +
            toolPrefix + "': " + command, rationale);
    }

    if (!j.contains("confidence") || !j["confidence"].is_number()) {
        return TranslationOutcome::failure(TranslationError::Malformed,
            "The AI response did not include a confidence score.", rationale);
    }

    double conf = j["confidence"].get<double>();
    if (std::isnan(conf) || conf < 0.0 || conf > 100.0 ||
        conf != std::floor(conf)) {
        return TranslationOutcome::failure(TranslationError::Malformed,
            "Invalid confidence score (must be an integer 0-100).", rationale);
    }

    TranslationResult result;
    result.command    = command;
    result.confidence = static_cast<int>(conf);
    result.rationale  = rationale;
    return TranslationOutcome::success(result);
}
