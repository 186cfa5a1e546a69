#include "config/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string getEnv(const std::string& key, const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return (val && *val) ? val : defaultVal;
}

} // namespace

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::debug("No config file at {}, using defaults", path);
        return AppConfig{};
    }

    try {
        nlohmann::json j;
        f >> j;
        spdlog::info("Loaded config: {}", path);
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config {}: {}", path, e.what());
        return AppConfig{};
    }
}

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    AppConfig c;
    if (!j.is_object()) return c;

    if (auto it = j.find("llm"); it != j.end() && it->is_object()) {
        auto& l = *it;
        c.llm.ollamaHost  = l.value("ollama_host",  c.llm.ollamaHost);
        c.llm.ollamaModel = l.value("ollama_model", c.llm.ollamaModel);
        c.llm.remoteHost  = l.value("remote_host",  c.llm.remoteHost);
        c.llm.remotePath  = l.value("remote_path",  c.llm.remotePath);
        c.llm.remoteModel = l.value("remote_model", c.llm.remoteModel);
        c.llm.useLocal    = l.value("use_local",    c.llm.useLocal);
        c.llm.timeoutMs   = l.value("timeout_ms",   c.llm.timeoutMs);
        c.llm.maxRetries  = l.value("max_retries",  c.llm.maxRetries);
        c.llm.temperature = l.value("temperature",  c.llm.temperature);
        c.llm.maxTokens   = l.value("max_tokens",   c.llm.maxTokens);
    }

    if (auto it = j.find("audit"); it != j.end() && it->is_object()) {
        c.audit.databasePath  = it->value("database_path",  c.audit.databasePath);
        c.audit.retentionDays = it->value("retention_days", c.audit.retentionDays);
        c.audit.pageSize      = it->value("page_size",      c.audit.pageSize);
    }

    if (auto it = j.find("display"); it != j.end() && it->is_object()) {
        c.display.confidenceThreshold = it->value("confidence_threshold",
                                                  c.display.confidenceThreshold);
        c.display.showReasoning   = it->value("show_reasoning",    c.display.showReasoning);
        c.display.frameIntervalMs = it->value("frame_interval_ms", c.display.frameIntervalMs);
    }

    if (auto it = j.find("exec"); it != j.end() && it->is_object()) {
        c.exec.toolBinary     = it->value("tool_binary",      c.exec.toolBinary);
        c.exec.outputCapBytes = it->value("output_cap_bytes", c.exec.outputCapBytes);
    }

    if (auto it = j.find("kubeconfig"); it != j.end() && it->is_object()) {
        c.kubeconfig.path    = it->value("path",    c.kubeconfig.path);
        c.kubeconfig.context = it->value("context", c.kubeconfig.context);
    }

    if (auto it = j.find("allowlist"); it != j.end() && it->is_object())
        c.allowlistPath = it->value("path", c.allowlistPath);

    if (j.contains("risk"))
        c.risk = VerbCatalog::fromJson(j["risk"]);

    c.logLevel = j.value("log_level", c.logLevel);

    // Clamp values that would break invariants
    if (c.llm.timeoutMs <= 0)   c.llm.timeoutMs = 10000;
    if (c.llm.maxRetries < 0)   c.llm.maxRetries = 0;
    if (c.llm.maxRetries > 1)   c.llm.maxRetries = 1;
    if (c.audit.pageSize == 0)  c.audit.pageSize = 20;
    if (c.display.confidenceThreshold < 0 || c.display.confidenceThreshold > 100)
        c.display.confidenceThreshold = 70;
    if (c.display.frameIntervalMs <= 0 || c.display.frameIntervalMs > 100)
        c.display.frameIntervalMs = 50;
    return c;
}

void AppConfig::applyEnvironment() {
    kubeconfig.context = getEnv("KUBEGUARD_CONTEXT", kubeconfig.context);

    llm.remoteApiKey = getEnv("KUBEGUARD_API_KEY", getEnv("OPENAI_API_KEY", llm.remoteApiKey));
    llm.ollamaHost   = getEnv("OLLAMA_HOST", llm.ollamaHost);
    llm.ollamaModel  = getEnv("KUBEGUARD_MODEL", llm.ollamaModel);
    logLevel         = getEnv("KUBEGUARD_LOG_LEVEL", logLevel);

    // OLLAMA_HOST is commonly given without a scheme
    if (!llm.ollamaHost.empty() && llm.ollamaHost.find("://") == std::string::npos)
        llm.ollamaHost = "http://" + llm.ollamaHost;
}

void AppConfig::resolvePaths(const std::string& dataDir) {
    if (audit.databasePath.empty())
        audit.databasePath = (fs::path(dataDir) / "audit.db").string();
    if (allowlistPath.empty())
        allowlistPath = (fs::path(dataDir) / "allowlist").string();
}

std::string AppConfig::defaultDataDir() {
    std::string home = getEnv("HOME");
    if (home.empty()) return ".kubeguard";
    return (fs::path(home) / ".kubeguard").string();
}
