#pragma once
#include "safety/VerbCatalog.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Everything read from ~/.kubeguard/config.json plus environment
// overrides. Every key is optional; defaults live here.
struct AppConfig {
    struct Llm {
        std::string ollamaHost   = "http://localhost:11434";
        std::string ollamaModel  = "llama3:8b";
        std::string remoteHost   = "https://api.openai.com";
        std::string remotePath   = "/v1/chat/completions";
        std::string remoteModel  = "gpt-4o-mini";
        std::string remoteApiKey;                 // env only
        bool        useLocal     = true;
        int         timeoutMs    = 10000;
        int         maxRetries   = 1;
        float       temperature  = 0.1f;
        int         maxTokens    = 256;
    } llm;

    struct Audit {
        std::string databasePath;                 // default: <dataDir>/audit.db
        int         retentionDays = 90;
        size_t      pageSize      = 20;
    } audit;

    struct Display {
        int  confidenceThreshold = 70;
        bool showReasoning       = true;
        int  frameIntervalMs     = 50;
    } display;

    struct Exec {
        std::string toolBinary     = "kubectl";
        size_t      outputCapBytes = 10240;
    } exec;

    struct Kubeconfig {
        std::string path;
        std::string context;
    } kubeconfig;

    std::string allowlistPath;                    // default: <dataDir>/allowlist
    std::string logLevel = "info";
    VerbCatalog risk     = VerbCatalog::defaults();

    // Missing file -> defaults. Unreadable / malformed -> warning + defaults.
    static AppConfig load(const std::string& path);

    static AppConfig fromJson(const nlohmann::json& j);

    // KUBEGUARD_CONTEXT, OPENAI_API_KEY / KUBEGUARD_API_KEY,
    // OLLAMA_HOST, KUBEGUARD_MODEL, KUBEGUARD_LOG_LEVEL. KUBECONFIG is
    // read by EnvironmentResolver.
    void applyEnvironment();

    // Fills in paths that default to the data directory.
    void resolvePaths(const std::string& dataDir);

    // ~/.kubeguard
    static std::string defaultDataDir();
};

// Reads KEY=VALUE lines into the environment without overriding
// variables that are already set.
void loadDotEnv(const std::string& path);
