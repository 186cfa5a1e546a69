#include <gtest/gtest.h>
#include "confirm/ConfirmationEngine.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Answers by looking for a known phrase in the user prompt.
class ScriptedBackend : public ITranslationBackend {
public:
    void on(const std::string& phrase, const std::string& response) {
        std::lock_guard lock(mutex_);
        responses_[phrase] = response;
    }

    int delayMs = 0;

    bool isAvailable() const override { return true; }

    std::string complete(const std::string&, const std::string& user, int) const override {
        if (delayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        std::lock_guard lock(mutex_);
        for (auto& [phrase, response] : responses_)
            if (user.find(phrase) != std::string::npos) return response;
        throw BackendError("no scripted answer", false);
    }

    std::string backendName() const override { return "scripted"; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> responses_;
};

std::string answer(const std::string& command, int confidence,
                   const std::string& rationale = "ok") {
    nlohmann::json j = {{"command", command}, {"confidence", confidence},
                        {"rationale", rationale}};
    return j.dump();
}

} // namespace

class ConfirmationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() /
                  ("kubeguard_engine_test_" + std::to_string(::getpid()) + "_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tmpDir_);

        AuditLog::Config ac;
        ac.databasePath = (tmpDir_ / "audit.db").string();
        audit_ = std::make_unique<AuditLog>(ac);
        ASSERT_TRUE(audit_->open());

        allowlist_ = std::make_unique<Allowlist>((tmpDir_ / "allowlist").string());
        ASSERT_TRUE(allowlist_->load());
    }

    void TearDown() override {
        engine_.reset();
        audit_.reset();
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    // toolBinary stands in for kubectl: /bin/echo by default.
    void makeEngine(const EnvironmentContext& ctx,
                    const std::string& toolBinary = "/bin/echo",
                    int translatorTimeoutMs = 2000,
                    int watchdogGraceMs = 2000)
    {
        TranslatorConfig tc;
        tc.timeoutMs = translatorTimeoutMs;
        std::vector<std::unique_ptr<ITranslationBackend>> backends;
        auto backend = std::make_unique<ScriptedBackend>();
        backend_ = backend.get();
        backends.push_back(std::move(backend));
        auto translator = std::make_shared<Translator>(tc, std::move(backends));

        ExecutorConfig ec;
        ec.toolBinary  = toolBinary;
        ec.killGraceMs = 500;
        auto executor = std::make_shared<CommandExecutor>(ec);

        EngineConfig cfg;
        cfg.watchdogGraceMs = watchdogGraceMs;
        engine_ = std::make_unique<ConfirmationEngine>(
            cfg, translator, classifier_, *allowlist_, *audit_, executor, ctx);
    }

    void type(const std::string& text) {
        for (char c : text) engine_->handleKey(KeyEvent::character(std::string(1, c)));
    }

    void press(KeyEvent::Kind kind) { engine_->handleKey(KeyEvent::of(kind)); }

    void submitLine(const std::string& text) {
        type(text);
        press(KeyEvent::Kind::Enter);
    }

    // Ticks until the engine is waiting on the operator again.
    EngineState settle(int timeoutMs = 5000) {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeoutMs);
        while (std::chrono::steady_clock::now() < deadline) {
            engine_->tick();
            auto s = engine_->state();
            if (s == EngineState::Normal || s == EngineState::ModalActive) return s;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return engine_->state();
    }

    std::vector<AuditLogEntry> entries() const {
        return audit_->query(AuditFilter::recent(100));
    }

    static EnvironmentContext devContext() {
        return EnvironmentContext::make("dev-local", "kind-dev", std::nullopt, "alice");
    }
    static EnvironmentContext prodContext() {
        return EnvironmentContext::make("prod-east", "gke-prod", std::string("web"), "alice");
    }

    fs::path tmpDir_;
    RiskClassifier classifier_;
    std::unique_ptr<AuditLog> audit_;
    std::unique_ptr<Allowlist> allowlist_;
    ScriptedBackend* backend_ = nullptr;
    std::unique_ptr<ConfirmationEngine> engine_;
};

TEST_F(ConfirmationEngineTest, LowRiskRunsWithoutModal) {
    makeEngine(devContext());
    backend_->on("show pods", answer("kubectl get pods", 95));

    submitLine("show pods");
    EXPECT_EQ(engine_->state(), EngineState::Translating);
    ASSERT_EQ(settle(), EngineState::Normal);

    EXPECT_EQ(engine_->dialog(), nullptr);
    EXPECT_NE(engine_->output().find("$ kubectl get pods"), std::string::npos);
    EXPECT_NE(engine_->output().find("get pods"), std::string::npos);
    EXPECT_TRUE(engine_->banner().empty());

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    EXPECT_EQ(rows[0].naturalLanguageInput, "show pods");
    EXPECT_EQ(rows[0].confidence, 95);
    EXPECT_EQ(rows[0].exitCode, 0);
    EXPECT_EQ(rows[0].riskLevel, RiskLevel::Low);
    EXPECT_EQ(rows[0].environmentName, "dev-local");
}

TEST_F(ConfirmationEngineTest, MediumRiskDenyIsCancelled) {
    makeEngine(prodContext());
    backend_->on("scale api to 5",
                 answer("kubectl scale deployment api --replicas=5", 90));

    submitLine("scale api to 5");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    ASSERT_NE(engine_->dialog(), nullptr);
    EXPECT_FALSE(engine_->dialog()->typed());
    EXPECT_EQ(engine_->dialog()->selected(), ConfirmationDialog::Button::No);

    press(KeyEvent::Kind::Enter);   // default button is No
    settle();

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Cancelled);
    EXPECT_FALSE(rows[0].exitCode);
    EXPECT_EQ(rows[0].riskLevel, RiskLevel::Medium);
}

TEST_F(ConfirmationEngineTest, TypedPhraseMismatchCancels) {
    makeEngine(prodContext());
    backend_->on("delete deployment nginx",
                 answer("kubectl delete deployment nginx", 92));

    submitLine("delete deployment nginx");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    ASSERT_TRUE(engine_->dialog()->typed());
    EXPECT_EQ(engine_->dialog()->spec().expectedPhrase, "nginx");

    type("ngin");
    press(KeyEvent::Kind::Enter);
    settle();

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Cancelled);
    EXPECT_EQ(rows[0].riskLevel, RiskLevel::High);
    EXPECT_NE(engine_->output().find("did not match"), std::string::npos);
}

TEST_F(ConfirmationEngineTest, TypedPhraseMatchExecutes) {
    makeEngine(prodContext());
    backend_->on("delete deployment nginx",
                 answer("kubectl delete deployment nginx", 92));

    submitLine("delete deployment nginx");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    type("nginx");
    press(KeyEvent::Kind::Enter);
    ASSERT_EQ(settle(), EngineState::Normal);

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    EXPECT_EQ(rows[0].exitCode, 0);
    EXPECT_EQ(rows[0].stdoutText, "delete deployment nginx\n");
    EXPECT_EQ(rows[0].namespaceName, std::optional<std::string>("web"));
}

TEST_F(ConfirmationEngineTest, TranslationTimeoutFallsBackToManualEntry) {
    makeEngine(devContext(), "/bin/echo", 100, 100);
    backend_->delayMs = 800;
    backend_->on("show pods", answer("kubectl get pods", 95));

    submitLine("show pods");
    ASSERT_EQ(settle(), EngineState::Normal);

    EXPECT_EQ(engine_->input(), "kubectl ");
    EXPECT_FALSE(engine_->notice().empty());
    EXPECT_EQ(audit_->count(), 0);

    // Manual entry still works afterwards
    type("get ns");
    press(KeyEvent::Kind::Enter);
    ASSERT_EQ(settle(), EngineState::Normal);
    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].finalCommand, "kubectl get ns");
    EXPECT_FALSE(rows[0].confidence);
}

TEST_F(ConfirmationEngineTest, LowConfidenceShowsBanner) {
    makeEngine(devContext());
    backend_->on("pods maybe", answer("kubectl get pods", 62, "guessing the resource"));

    submitLine("pods maybe");
    ASSERT_EQ(settle(), EngineState::Normal);

    EXPECT_EQ(engine_->dialog(), nullptr);
    EXPECT_NE(engine_->banner().find("62%"), std::string::npos);
    EXPECT_NE(engine_->banner().find("guessing the resource"), std::string::npos);
    EXPECT_EQ(audit_->count(), 1);
}

TEST_F(ConfirmationEngineTest, AllowAlwaysSkipsLaterModal) {
    makeEngine(devContext());
    const std::string cmd = "kubectl rollout restart deployment/api";
    backend_->on("restart api", answer(cmd, 90));

    submitLine("restart api");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    type("a");
    ASSERT_EQ(settle(), EngineState::Normal);
    EXPECT_TRUE(allowlist_->isAllowed(cmd));

    submitLine("restart api");
    ASSERT_EQ(settle(), EngineState::Normal);
    EXPECT_EQ(engine_->dialog(), nullptr);

    auto rows = entries();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    EXPECT_EQ(rows[1].userAction, UserAction::Executed);
}

TEST_F(ConfirmationEngineTest, EditedCommandKeepsOriginal) {
    makeEngine(devContext());
    backend_->on("scale api", answer("kubectl scale deployment api --replicas=5", 90));

    submitLine("scale api");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    press(KeyEvent::Kind::Edit);

    EXPECT_EQ(engine_->state(), EngineState::Normal);
    EXPECT_TRUE(engine_->editing());
    EXPECT_EQ(engine_->input(), "kubectl scale deployment api --replicas=5");

    engine_->setInput("kubectl get deployment api");
    press(KeyEvent::Kind::Enter);
    ASSERT_EQ(settle(), EngineState::Normal);

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Edited);
    EXPECT_EQ(rows[0].finalCommand, "kubectl get deployment api");
    EXPECT_EQ(rows[0].originalCommand,
              std::optional<std::string>("kubectl scale deployment api --replicas=5"));
    EXPECT_EQ(rows[0].naturalLanguageInput, "scale api");
}

TEST_F(ConfirmationEngineTest, AbandonedEditIsCancelled) {
    makeEngine(devContext());
    backend_->on("scale api", answer("kubectl scale deployment api --replicas=5", 90));

    submitLine("scale api");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    press(KeyEvent::Kind::Edit);
    press(KeyEvent::Kind::Escape);

    EXPECT_FALSE(engine_->editing());
    EXPECT_TRUE(engine_->input().empty());
    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Cancelled);
}

TEST_F(ConfirmationEngineTest, ModalSwallowsTyping) {
    makeEngine(devContext());
    backend_->on("scale api", answer("kubectl scale deployment api --replicas=5", 90));

    submitLine("scale api");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    type("zzz");
    press(KeyEvent::Kind::Backspace);

    EXPECT_EQ(engine_->state(), EngineState::ModalActive);
    EXPECT_TRUE(engine_->input().empty());
    EXPECT_EQ(audit_->count(), 0);

    press(KeyEvent::Kind::Escape);
    settle();
    EXPECT_EQ(audit_->count(), 1);
}

TEST_F(ConfirmationEngineTest, SubmitWhileBusyShowsNotice) {
    makeEngine(devContext());
    backend_->delayMs = 300;
    backend_->on("show pods", answer("kubectl get pods", 95));

    submitLine("show pods");
    ASSERT_EQ(engine_->state(), EngineState::Translating);
    submitLine("show nodes");
    EXPECT_NE(engine_->notice().find("Still processing"), std::string::npos);

    ASSERT_EQ(settle(), EngineState::Normal);
    EXPECT_EQ(audit_->count(), 1);
}

TEST_F(ConfirmationEngineTest, CtrlCCancelsTranslation) {
    makeEngine(devContext());
    backend_->delayMs = 300;
    backend_->on("show pods", answer("kubectl get pods", 95));

    submitLine("show pods");
    press(KeyEvent::Kind::Interrupt);
    EXPECT_EQ(engine_->state(), EngineState::Normal);
    EXPECT_FALSE(engine_->quitRequested());
    EXPECT_EQ(audit_->count(), 0);
}

TEST_F(ConfirmationEngineTest, ShutdownStopsRunningCommand) {
    // Let workers from earlier tests drain so the count below is ours
    ASSERT_TRUE(BackgroundWorkers::waitIdle(std::chrono::seconds(5)));
    makeEngine(devContext(), "/bin/sh");

    submitLine("kubectl -c 'sleep 10'");
    ASSERT_EQ(engine_->state(), EngineState::Executing);
    EXPECT_EQ(BackgroundWorkers::running(), 1);

    auto start = std::chrono::steady_clock::now();
    engine_->shutdown();
    EXPECT_TRUE(BackgroundWorkers::waitIdle(std::chrono::seconds(3)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_EQ(BackgroundWorkers::running(), 0);
}

TEST_F(ConfirmationEngineTest, ClarificationIsNotExecuted) {
    makeEngine(devContext());
    backend_->on("show logs",
                 answer("kubectl logs", 30, "NEEDS_CLARIFICATION: Which pod?"));

    submitLine("show logs");
    ASSERT_EQ(settle(), EngineState::Normal);

    EXPECT_EQ(engine_->input(), "kubectl logs");
    EXPECT_NE(engine_->notice().find("Which pod?"), std::string::npos);
    EXPECT_EQ(audit_->count(), 0);
}

TEST_F(ConfirmationEngineTest, MalformedResponseIsReported) {
    makeEngine(devContext());
    backend_->on("wipe disk", answer("rm -rf /", 99, "not a kubectl command"));

    submitLine("wipe disk");
    ASSERT_EQ(settle(), EngineState::Normal);

    EXPECT_NE(engine_->notice().find("not a kubectl command"), std::string::npos);
    EXPECT_EQ(audit_->count(), 0);
}

TEST_F(ConfirmationEngineTest, DirectCommandIsClassified) {
    makeEngine(devContext());

    submitLine("kubectl delete pod api-0");
    ASSERT_EQ(settle(), EngineState::ModalActive);
    EXPECT_EQ(engine_->dialog()->risk(), RiskLevel::High);
    EXPECT_FALSE(engine_->dialog()->typed());
    EXPECT_FALSE(engine_->proposal()->confidence);

    type("y");
    ASSERT_EQ(settle(), EngineState::Normal);
    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    EXPECT_FALSE(rows[0].confidence);
    EXPECT_EQ(rows[0].naturalLanguageInput, "kubectl delete pod api-0");
}

TEST_F(ConfirmationEngineTest, FailedCommandRecordsExitCode) {
    makeEngine(devContext(), "/bin/sh");

    submitLine("kubectl -c 'echo nope >&2; exit 4'");
    ASSERT_EQ(settle(), EngineState::Normal);

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].exitCode, 4);
    EXPECT_EQ(rows[0].stderrText, "nope\n");
    EXPECT_NE(engine_->output().find("Error: nope"), std::string::npos);
}

TEST_F(ConfirmationEngineTest, SpawnFailureIsAudited) {
    makeEngine(devContext(), "/nonexistent/kubectl");

    submitLine("kubectl get pods");
    ASSERT_EQ(settle(), EngineState::Normal);

    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    EXPECT_FALSE(rows[0].exitCode);
    EXPECT_NE(rows[0].stderrText.find("not found"), std::string::npos);
}

TEST_F(ConfirmationEngineTest, InterruptRunningCommand) {
    makeEngine(devContext(), "/bin/sh");

    submitLine("kubectl -c 'sleep 5'");
    ASSERT_EQ(engine_->state(), EngineState::Executing);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    press(KeyEvent::Kind::Interrupt);
    ASSERT_EQ(settle(3000), EngineState::Normal);

    EXPECT_NE(engine_->output().find("[Interrupted]"), std::string::npos);
    auto rows = entries();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].userAction, UserAction::Executed);
    ASSERT_TRUE(rows[0].exitCode);
    EXPECT_NE(*rows[0].exitCode, 0);
}

TEST_F(ConfirmationEngineTest, BuiltinsDoNotTouchAudit) {
    makeEngine(devContext());

    submitLine("help");
    EXPECT_NE(engine_->output().find("history"), std::string::npos);

    submitLine("history");
    EXPECT_EQ(engine_->output(), "No audit entries found.");

    submitLine("history lastyear");
    EXPECT_NE(engine_->notice().find("Usage"), std::string::npos);

    submitLine("allowlist");
    EXPECT_EQ(engine_->output(), "Allowlist is empty.");

    submitLine("clear");
    EXPECT_TRUE(engine_->output().empty());

    submitLine("use-context prod");
    EXPECT_FALSE(engine_->notice().empty());

    EXPECT_EQ(audit_->count(), 0);
    EXPECT_FALSE(engine_->quitRequested());

    submitLine("exit");
    EXPECT_TRUE(engine_->quitRequested());
}

TEST_F(ConfirmationEngineTest, AllowlistRemoveBuiltin) {
    makeEngine(devContext());
    ASSERT_TRUE(allowlist_->add("kubectl cordon node-1"));

    submitLine("allowlist");
    EXPECT_NE(engine_->output().find("kubectl cordon node-1"), std::string::npos);

    submitLine("allowlist remove kubectl cordon node-1");
    EXPECT_FALSE(allowlist_->isAllowed("kubectl cordon node-1"));
}

TEST_F(ConfirmationEngineTest, HistoryShowsRecordedEntries) {
    makeEngine(devContext());
    submitLine("kubectl get pods");
    ASSERT_EQ(settle(), EngineState::Normal);

    submitLine("history env dev-local");
    EXPECT_NE(engine_->output().find("kubectl get pods"), std::string::npos);
    EXPECT_NE(engine_->output().find("1 entry"), std::string::npos);
}

TEST_F(ConfirmationEngineTest, UseContextSwitchesEnvironment) {
    auto kubeconfig = tmpDir_ / "kubeconfig";
    {
        std::ofstream f(kubeconfig);
        f << "apiVersion: v1\n"
             "kind: Config\n"
             "current-context: dev-local\n"
             "clusters:\n"
             "- name: kind-dev\n"
             "  cluster: {server: https://127.0.0.1:6443}\n"
             "- name: gke-prod\n"
             "  cluster: {server: https://10.0.0.1}\n"
             "users:\n"
             "- name: alice\n"
             "  user: {}\n"
             "contexts:\n"
             "- name: dev-local\n"
             "  context: {cluster: kind-dev, user: alice}\n"
             "- name: prod-east\n"
             "  context: {cluster: gke-prod, user: alice, namespace: payments}\n";
    }
    EnvironmentResolver::Options opts;
    opts.kubeconfigPath = kubeconfig.string();
    EnvironmentResolver resolver(opts);

    TranslatorConfig tc;
    auto translator = std::make_shared<Translator>(
        tc, std::vector<std::unique_ptr<ITranslationBackend>>{});
    ExecutorConfig ec;
    ec.toolBinary = "/bin/echo";
    ConfirmationEngine engine({}, translator, classifier_, *allowlist_, *audit_,
                              std::make_shared<CommandExecutor>(ec),
                              resolver.resolve(), &resolver);
    EXPECT_EQ(engine.context().name, "dev-local");

    engine.setInput("use-context");
    engine.submit();
    EXPECT_NE(engine.output().find("* dev-local"), std::string::npos);
    EXPECT_NE(engine.output().find("prod-east"), std::string::npos);

    engine.setInput("use-context prod-east");
    engine.submit();
    EXPECT_TRUE(engine.context().isProduction());
    EXPECT_EQ(engine.context().effectiveNamespace(), "payments");

    engine.setInput("use-context missing");
    engine.submit();
    EXPECT_FALSE(engine.notice().empty());
    EXPECT_EQ(engine.context().name, "prod-east");
}

TEST_F(ConfirmationEngineTest, NoBackendFallsBackToManualEntry) {
    TranslatorConfig tc;
    auto translator = std::make_shared<Translator>(
        tc, std::vector<std::unique_ptr<ITranslationBackend>>{});
    ConfirmationEngine engine({}, translator, classifier_, *allowlist_, *audit_,
                              std::make_shared<CommandExecutor>(), devContext());

    engine.setInput("show pods");
    engine.submit();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (engine.state() != EngineState::Normal &&
           std::chrono::steady_clock::now() < deadline) {
        engine.tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(engine.input(), "kubectl ");
    EXPECT_NE(engine.notice().find("unavailable"), std::string::npos);
    EXPECT_EQ(audit_->count(), 0);
}
