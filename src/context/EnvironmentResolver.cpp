#include "context/EnvironmentResolver.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char* kRemediation =
    " Run 'kubectl config get-contexts' and 'kubectl config use-context <name>',"
    " or point $KUBECONFIG at a valid kubeconfig file.";

YAML::Node loadKubeconfig(const std::string& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError(
            "kubectl context not configured. No kubeconfig found at " +
            path + "." + kRemediation);
    }

    try {
        return YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        // Keep the raw parser message out of the user-facing text.
        spdlog::debug("kubeconfig parse error in {}: {}", path, e.what());
        throw ConfigurationError(
            "The kubeconfig at " + path + " could not be read (line " +
            std::to_string(e.mark.line + 1) + ")." + kRemediation);
    }
}

std::string scalarOrEmpty(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return "";
    return node.as<std::string>();
}

} // namespace

std::string EnvironmentResolver::defaultKubeconfigPath() {
    const char* home = std::getenv("HOME");
    fs::path base = home ? fs::path(home) : fs::current_path();
    return (base / ".kube" / "config").string();
}

std::string EnvironmentResolver::kubeconfigPath() const {
    if (!opts_.kubeconfigPath.empty())
        return opts_.kubeconfigPath;

    // $KUBECONFIG may hold a colon-separated list; the first entry wins.
    if (const char* env = std::getenv("KUBECONFIG")) {
        std::string value = env;
        auto colon = value.find(':');
        if (colon != std::string::npos) value = value.substr(0, colon);
        if (!value.empty()) return value;
    }
    return defaultKubeconfigPath();
}

EnvironmentContext EnvironmentResolver::resolve() const {
    return parse(kubeconfigPath(), opts_.contextOverride);
}

EnvironmentContext EnvironmentResolver::resolveContext(
    const std::string& contextName) const
{
    return parse(kubeconfigPath(), contextName);
}

std::vector<std::string> EnvironmentResolver::listContexts() const {
    std::vector<std::string> names;
    auto root = loadKubeconfig(kubeconfigPath());
    auto contexts = root["contexts"];
    if (!contexts || !contexts.IsSequence()) return names;

    for (const auto& entry : contexts) {
        auto name = scalarOrEmpty(entry["name"]);
        if (!name.empty()) names.push_back(name);
    }
    return names;
}

EnvironmentContext EnvironmentResolver::parse(
    const std::string& path,
    const std::string& contextName) const
{
    auto root = loadKubeconfig(path);
    if (!root || !root.IsMap()) {
        throw ConfigurationError(
            "The kubeconfig at " + path + " is empty." + kRemediation);
    }

    std::string active = contextName;
    if (active.empty()) active = scalarOrEmpty(root["current-context"]);
    if (active.empty()) {
        throw ConfigurationError(
            "No current-context is set in " + path + "." + kRemediation);
    }

    auto contexts = root["contexts"];
    if (!contexts || !contexts.IsSequence() || contexts.size() == 0) {
        throw ConfigurationError(
            "No contexts are defined in " + path + "." + kRemediation);
    }

    for (const auto& entry : contexts) {
        if (scalarOrEmpty(entry["name"]) != active) continue;

        auto ctx = entry["context"];
        std::string cluster = scalarOrEmpty(ctx["cluster"]);
        std::string user    = scalarOrEmpty(ctx["user"]);
        if (cluster.empty()) {
            throw ConfigurationError(
                "Context '" + active + "' has no cluster." + kRemediation);
        }

        std::optional<std::string> ns;
        auto nsValue = scalarOrEmpty(ctx["namespace"]);
        if (!nsValue.empty()) ns = nsValue;

        auto result = EnvironmentContext::make(active, cluster, ns, user);
        spdlog::info("Resolved context '{}' (cluster={}, namespace={}, env={})",
                     result.name, result.cluster, result.effectiveNamespace(),
                     environmentClassToString(result.environmentClass));
        return result;
    }

    throw ConfigurationError(
        "Context '" + active + "' was not found in " + path + "." +
        kRemediation);
}
