#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

// Coarse deployment tier derived from the kubeconfig context name.
enum class EnvironmentClass {
    Development,
    Staging,
    Production,
    Unknown        // no pattern matched, weighted like Staging
};

inline const char* environmentClassToString(EnvironmentClass c) {
    switch (c) {
        case EnvironmentClass::Development: return "development";
        case EnvironmentClass::Staging:     return "staging";
        case EnvironmentClass::Production:  return "production";
        case EnvironmentClass::Unknown:     return "unknown";
    }
    return "unknown";
}

// Case-insensitive substring match, most dangerous tier first so that
// "prod-dev-mirror" is still treated as production.
inline EnvironmentClass classifyEnvironmentName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower.find("prod") != std::string::npos)
        return EnvironmentClass::Production;
    if (lower.find("stag") != std::string::npos)
        return EnvironmentClass::Staging;
    if (lower.find("dev") != std::string::npos)
        return EnvironmentClass::Development;
    return EnvironmentClass::Unknown;
}

// Immutable per-session snapshot of the active kubeconfig context.
// Replaced wholesale on a context switch, never edited in place.
struct EnvironmentContext {
    std::string                name;          // context name
    std::string                cluster;
    std::optional<std::string> namespaceName;
    std::string                user;
    EnvironmentClass           environmentClass = EnvironmentClass::Unknown;

    static EnvironmentContext make(std::string name,
                                   std::string cluster,
                                   std::optional<std::string> ns,
                                   std::string user) {
        EnvironmentContext ctx;
        ctx.environmentClass = classifyEnvironmentName(name);
        ctx.name             = std::move(name);
        ctx.cluster          = std::move(cluster);
        ctx.namespaceName    = std::move(ns);
        ctx.user             = std::move(user);
        return ctx;
    }

    std::string effectiveNamespace() const {
        return namespaceName.value_or("default");
    }

    bool isProduction() const {
        return environmentClass == EnvironmentClass::Production;
    }

    // Tier used for risk weighting: Unknown behaves as Staging.
    EnvironmentClass weightedClass() const {
        return environmentClass == EnvironmentClass::Unknown
            ? EnvironmentClass::Staging : environmentClass;
    }
};
