#include "audit/AuditFormatter.hpp"
#include "audit/AuditLog.hpp"
#include "config/AppConfig.hpp"
#include "confirm/ConfirmationEngine.hpp"
#include "context/EnvironmentResolver.hpp"
#include "exec/CommandExecutor.hpp"
#include "safety/Allowlist.hpp"
#include "safety/RiskClassifier.hpp"
#include "translate/OllamaBackend.hpp"
#include "translate/RemoteBackend.hpp"
#include "translate/Translator.hpp"
#include "ui/InteractionLoop.hpp"
#include "ui/TerminalGuard.hpp"
#include "util/BackgroundTask.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

static void setupLogging(const std::string& dataDir, const std::string& level,
                         bool console) {
    std::vector<spdlog::sink_ptr> sinks;

    std::error_code ec;
    fs::create_directories(dataDir, ec);
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (fs::path(dataDir) / "kubeguard.log").string(), 1048576 * 5, 3));  // 5MB, 3 files
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "kubeguard: cannot open log file: " << e.what() << "\n";
    }

    // The full-screen UI owns stdout; only non-interactive modes log there
    if (console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("kubeguard", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);

    spdlog::flush_on(spdlog::level::warn);
}

static void printUsage() {
    std::cout <<
        "Usage: kubeguard [--config <file>] [--context <name>] [--kubeconfig <file>]\n"
        "       kubeguard history [today | week | <N>d | env <name>] [page]\n"
        "\n"
        "Translates plain-language requests into kubectl commands, asks for\n"
        "confirmation in proportion to their risk, and records every attempt.\n";
}

static int runHistory(AuditLog& audit, const AppConfig& config,
                      const std::vector<std::string>& args) {
    std::string error;
    auto filter = AuditFormatter::parseHistoryArgs(args, config.audit.pageSize, error);
    if (!filter) {
        std::cerr << error << "\n";
        return 2;
    }
    std::cout << AuditFormatter::formatTable(audit.query(*filter)) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    std::string dataDir    = AppConfig::defaultDataDir();
    std::string configPath = (fs::path(dataDir) / "config.json").string();
    std::string contextArg;
    std::string kubeconfigArg;
    bool history = false;
    std::vector<std::string> historyArgs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (history) {
            historyArgs.push_back(arg);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--context" && i + 1 < argc) {
            contextArg = argv[++i];
        } else if (arg == "--kubeconfig" && i + 1 < argc) {
            kubeconfigArg = argv[++i];
        } else if (arg == "history") {
            history = true;
        } else {
            std::cerr << "kubeguard: unknown argument '" << arg << "'\n";
            printUsage();
            return 2;
        }
    }

    auto config = AppConfig::load(configPath);
    config.applyEnvironment();
    config.resolvePaths(dataDir);
    if (!contextArg.empty())    config.kubeconfig.context = contextArg;
    if (!kubeconfigArg.empty()) config.kubeconfig.path    = kubeconfigArg;

    setupLogging(dataDir, config.logLevel, history);
    spdlog::info("KubeGuard v0.1.0 starting");

    // Retention sweep runs inside open(), before any write
    AuditLog::Config auditConfig;
    auditConfig.databasePath   = config.audit.databasePath;
    auditConfig.retentionDays  = config.audit.retentionDays;
    auditConfig.outputCapBytes = config.exec.outputCapBytes;
    AuditLog audit(auditConfig);
    if (!audit.open())
        std::cerr << "kubeguard: warning: audit log unavailable ("
                  << config.audit.databasePath << "); see kubeguard.log\n";

    if (history) {
        if (!audit.isOpen()) return 1;
        return runHistory(audit, config, historyArgs);
    }

    Allowlist allowlist(config.allowlistPath);
    if (!allowlist.load())
        std::cerr << "kubeguard: warning: could not read allowlist "
                  << config.allowlistPath << "\n";

    EnvironmentResolver resolver({config.kubeconfig.path, config.kubeconfig.context});
    EnvironmentContext context;
    try {
        context = resolver.resolve();
    } catch (const ConfigurationError& e) {
        spdlog::error("Cannot start session: {}", e.what());
        std::cerr << "kubeguard: " << e.what() << "\n";
        return 2;
    }

    // Backends: local first, remote as fallback
    std::vector<std::unique_ptr<ITranslationBackend>> backends;
    if (config.llm.useLocal) {
        OllamaBackend::Config oc;
        oc.host        = config.llm.ollamaHost;
        oc.model       = config.llm.ollamaModel;
        oc.temperature = config.llm.temperature;
        oc.maxTokens   = config.llm.maxTokens;
        backends.push_back(std::make_unique<OllamaBackend>(oc));
    }
    if (!config.llm.remoteApiKey.empty()) {
        RemoteBackend::Config rc;
        rc.host        = config.llm.remoteHost;
        rc.path        = config.llm.remotePath;
        rc.apiKey      = config.llm.remoteApiKey;
        rc.model       = config.llm.remoteModel;
        rc.temperature = config.llm.temperature;
        rc.maxTokens   = config.llm.maxTokens;
        backends.push_back(std::make_unique<RemoteBackend>(rc));
    } else {
        spdlog::info("No remote API key set; remote fallback disabled");
    }

    TranslatorConfig tc;
    tc.timeoutMs  = config.llm.timeoutMs;
    tc.maxRetries = config.llm.maxRetries;
    tc.operations = config.risk.operations;
    auto translator = std::make_shared<const Translator>(tc, std::move(backends));

    ExecutorConfig ec;
    ec.toolBinary     = config.exec.toolBinary;
    ec.outputCapBytes = config.exec.outputCapBytes;
    auto executor = std::make_shared<const CommandExecutor>(ec);

    RiskClassifier classifier(config.risk);

    EngineConfig engineConfig;
    engineConfig.confidenceThreshold = config.display.confidenceThreshold;
    engineConfig.historyPageSize     = config.audit.pageSize;

    ConfirmationEngine engine(engineConfig, translator, classifier, allowlist,
                              audit, executor, context, &resolver);

    int rc = 0;
    {
        TerminalGuard guard;
        InteractionLoop loop(engine, config.display.frameIntervalMs,
                             config.display.showReasoning);
        rc = loop.run();
    }

    // A translation or kubectl run may still be in flight; its worker logs
    // through spdlog and must not outlive the static loggers.
    engine.shutdown();
    auto drain = std::chrono::milliseconds(
        std::max(tc.timeoutMs, ec.killGraceMs) + 1000);
    if (!BackgroundWorkers::waitIdle(drain)) {
        spdlog::warn("{} background worker(s) still running after {}ms; exiting without cleanup",
                     BackgroundWorkers::running(), drain.count());
        spdlog::default_logger()->flush();
        std::quick_exit(rc);
    }

    spdlog::info("KubeGuard exited ({} translations, {} failed, {:.0f}ms avg)",
                 translator->totalCalls(), translator->failedCalls(),
                 translator->avgLatencyMs());
    return rc;
}
