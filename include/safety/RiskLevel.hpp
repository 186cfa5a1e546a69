#pragma once
#include <optional>
#include <string>

// Low = read-only, Medium = mutating but reversible,
// High = destructive or irreversible.
enum class RiskLevel {
    Low,
    Medium,
    High
};

inline const char* riskLevelToString(RiskLevel r) {
    switch (r) {
        case RiskLevel::Low:    return "LOW";
        case RiskLevel::Medium: return "MEDIUM";
        case RiskLevel::High:   return "HIGH";
    }
    return "HIGH";
}

inline std::optional<RiskLevel> riskLevelFromString(const std::string& s) {
    if (s == "LOW")    return RiskLevel::Low;
    if (s == "MEDIUM") return RiskLevel::Medium;
    if (s == "HIGH")   return RiskLevel::High;
    return std::nullopt;
}
