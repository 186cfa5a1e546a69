#pragma once
#include "EnvironmentContext.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Raised when no active context can be determined. The message is meant
// for the operator and always ends with a remediation hint.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Reads a kubeconfig file and derives the EnvironmentContext.
// Lookup order: explicit path, $KUBECONFIG, ~/.kube/config.
class EnvironmentResolver {
public:
    struct Options {
        std::string kubeconfigPath;   // empty = discover
        std::string contextOverride;  // empty = use current-context
    };

    EnvironmentResolver() = default;
    explicit EnvironmentResolver(const Options& opts) : opts_(opts) {}

    // Throws ConfigurationError.
    EnvironmentContext resolve() const;

    // Resolve a specific context by name (mid-session context switch).
    EnvironmentContext resolveContext(const std::string& contextName) const;

    // Names of every context defined in the file.
    std::vector<std::string> listContexts() const;

    // Effective file path after applying the lookup order.
    std::string kubeconfigPath() const;

    static std::string defaultKubeconfigPath();

private:
    EnvironmentContext parse(const std::string& path,
                             const std::string& contextName) const;

    Options opts_;
};
