#include "audit/AuditLog.hpp"
#include "exec/CommandExecutor.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

void bindOptionalText(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) {
    if (v) sqlite3_bind_text(stmt, idx, v->c_str(), -1, SQLITE_TRANSIENT);
    else   sqlite3_bind_null(stmt, idx);
}

void bindOptionalInt(sqlite3_stmt* stmt, int idx, const std::optional<long long>& v) {
    if (v) sqlite3_bind_int64(stmt, idx, *v);
    else   sqlite3_bind_null(stmt, idx);
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return p ? std::string(p) : std::string();
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return columnText(stmt, col);
}

std::optional<long long> columnOptionalInt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

} // namespace

AuditLog::AuditLog(const Config& config) : config_(config) {}

AuditLog::~AuditLog() {
    if (db_) sqlite3_close(db_);
}

bool AuditLog::open() {
    std::lock_guard lock(dbMutex_);
    if (db_) return true;

    if (config_.databasePath != ":memory:") {
        fs::path parent = fs::path(config_.databasePath).parent_path();
        std::error_code ec;
        if (!parent.empty()) fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create audit directory {}: {}",
                          parent.string(), ec.message());
            return false;
        }
    }

    int rc = sqlite3_open_v2(config_.databasePath.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open audit database {}: {}", config_.databasePath,
                      db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (config_.databasePath != ":memory:") {
        std::error_code ec;
        fs::permissions(config_.databasePath,
                        fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
    }

    sqlite3_busy_timeout(db_, 250);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;",
                     nullptr, nullptr, &errMsg) != SQLITE_OK) {
        spdlog::warn("Audit database pragmas failed: {}", errMsg ? errMsg : "?");
        sqlite3_free(errMsg);
    }

    if (!createSchema()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    spdlog::info("Audit log opened at {}", config_.databasePath);
    return true;
}

bool AuditLog::createSchema() {
    const char* createTable = R"(
        CREATE TABLE IF NOT EXISTS audit_log (
            id                     INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp              INTEGER NOT NULL,
            user_id                TEXT NOT NULL,
            natural_language_input TEXT NOT NULL,
            final_command          TEXT NOT NULL,
            original_command       TEXT,
            confidence             INTEGER CHECK (confidence IS NULL OR confidence BETWEEN 0 AND 100),
            risk_level             TEXT NOT NULL CHECK (risk_level IN ('LOW', 'MEDIUM', 'HIGH')),
            environment_name       TEXT NOT NULL,
            cluster                TEXT NOT NULL,
            namespace              TEXT,
            exit_code              INTEGER,
            stdout                 TEXT,
            stderr                 TEXT,
            duration_ms            INTEGER,
            user_action            TEXT NOT NULL CHECK (user_action IN ('Executed', 'Cancelled', 'Edited')),
            created_at             TEXT NOT NULL DEFAULT (datetime('now')),
            CHECK (user_action <> 'Cancelled' OR exit_code IS NULL)
        )
    )";

    const char* createIndices = R"(
        CREATE INDEX IF NOT EXISTS idx_audit_timestamp   ON audit_log(timestamp);
        CREATE INDEX IF NOT EXISTS idx_audit_environment ON audit_log(environment_name);
        CREATE INDEX IF NOT EXISTS idx_audit_action      ON audit_log(user_action);
        CREATE INDEX IF NOT EXISTS idx_audit_env_time    ON audit_log(environment_name, timestamp);
    )";

    // Entries are immutable; only the retention sweep may delete.
    const char* createTrigger = R"(
        CREATE TRIGGER IF NOT EXISTS audit_log_immutable
        BEFORE UPDATE ON audit_log
        BEGIN
            SELECT RAISE(ABORT, 'audit entries are immutable');
        END
    )";

    const char* createVersion = R"(
        CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL);
        INSERT INTO schema_version (version)
            SELECT 1 WHERE NOT EXISTS (SELECT 1 FROM schema_version);
    )";

    char* errMsg = nullptr;
    for (const char* sql : {createTable, createIndices, createTrigger, createVersion}) {
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            spdlog::error("Failed to create audit schema: {}", errMsg ? errMsg : "?");
            sqlite3_free(errMsg);
            return false;
        }
    }

    sweepLocked(config_.retentionDays);
    return true;
}

AuditWriteResult AuditLog::record(const AuditLogEntry& entry) {
    AuditWriteResult result;
    std::lock_guard lock(dbMutex_);

    auto fail = [&](std::string msg) {
        result.error = std::move(msg);
        spdlog::warn("Audit write failed: {}", result.error);
        return result;
    };

    if (!db_)
        return fail("audit log is not open");

    int64_t now = currentTimestamp();
    int64_t ts  = entry.timestamp == 0 ? now : entry.timestamp;
    if (ts > now)
        return fail("timestamp is in the future");
    if (entry.userAction == UserAction::Cancelled && entry.exitCode)
        return fail("cancelled entry cannot carry an exit code");

    const char* sql = R"(
        INSERT INTO audit_log (
            timestamp, user_id, natural_language_input, final_command,
            original_command, confidence, risk_level, environment_name,
            cluster, namespace, exit_code, stdout, stderr, duration_ms,
            user_action)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        return fail(std::string("prepare: ") + sqlite3_errmsg(db_));

    const std::string userId = entry.userId.empty() ? currentUser() : entry.userId;
    const std::string out = truncateOutput(entry.stdoutText, config_.outputCapBytes);
    const std::string err = truncateOutput(entry.stderrText, config_.outputCapBytes);

    sqlite3_bind_int64(stmt, 1, ts);
    sqlite3_bind_text(stmt, 2, userId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.naturalLanguageInput.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, entry.finalCommand.c_str(), -1, SQLITE_TRANSIENT);
    bindOptionalText(stmt, 5, entry.originalCommand);
    bindOptionalInt(stmt, 6, entry.confidence ? std::optional<long long>(*entry.confidence)
                                              : std::nullopt);
    sqlite3_bind_text(stmt, 7, riskLevelToString(entry.riskLevel), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 8, entry.environmentName.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, entry.cluster.c_str(), -1, SQLITE_TRANSIENT);
    bindOptionalText(stmt, 10, entry.namespaceName);
    bindOptionalInt(stmt, 11, entry.exitCode ? std::optional<long long>(*entry.exitCode)
                                             : std::nullopt);
    sqlite3_bind_text(stmt, 12, out.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 13, err.c_str(), -1, SQLITE_TRANSIENT);
    bindOptionalInt(stmt, 14, entry.durationMs);
    sqlite3_bind_text(stmt, 15, userActionToString(entry.userAction), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE)
        return fail(std::string("insert: ") + sqlite3_errmsg(db_));

    result.ok = true;
    result.id = sqlite3_last_insert_rowid(db_);
    spdlog::debug("Audit entry {} recorded ({})", result.id,
                  userActionToString(entry.userAction));
    return result;
}

std::vector<AuditLogEntry> AuditLog::query(const AuditFilter& filter) const {
    std::lock_guard lock(dbMutex_);
    std::vector<AuditLogEntry> entries;
    if (!db_) return entries;

    std::string sql =
        "SELECT id, timestamp, user_id, natural_language_input, final_command, "
        "original_command, confidence, risk_level, environment_name, cluster, "
        "namespace, exit_code, stdout, stderr, duration_ms, user_action "
        "FROM audit_log ";

    switch (filter.kind) {
        case AuditFilter::Kind::Recent:
            break;
        case AuditFilter::Kind::DateRange:
            sql += "WHERE timestamp >= ? AND timestamp < ? ";
            break;
        case AuditFilter::Kind::Environment:
            sql += "WHERE environment_name = ? ";
            break;
    }
    sql += "ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare audit query: {}", sqlite3_errmsg(db_));
        return entries;
    }

    int idx = 1;
    if (filter.kind == AuditFilter::Kind::DateRange) {
        sqlite3_bind_int64(stmt, idx++, filter.from);
        sqlite3_bind_int64(stmt, idx++, filter.to);
    } else if (filter.kind == AuditFilter::Kind::Environment) {
        sqlite3_bind_text(stmt, idx++, filter.environment.c_str(), -1, SQLITE_TRANSIENT);
    }

    size_t limit = filter.limit == 0 ? 1 : std::min(filter.limit, config_.maxPageSize);
    sqlite3_bind_int64(stmt, idx++, static_cast<int64_t>(limit));
    sqlite3_bind_int64(stmt, idx++, static_cast<int64_t>(filter.offset));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AuditLogEntry e;
        e.id                   = sqlite3_column_int64(stmt, 0);
        e.timestamp            = sqlite3_column_int64(stmt, 1);
        e.userId               = columnText(stmt, 2);
        e.naturalLanguageInput = columnText(stmt, 3);
        e.finalCommand         = columnText(stmt, 4);
        e.originalCommand      = columnOptionalText(stmt, 5);
        if (auto c = columnOptionalInt(stmt, 6)) e.confidence = static_cast<int>(*c);
        e.riskLevel            = riskLevelFromString(columnText(stmt, 7)).value_or(RiskLevel::High);
        e.environmentName      = columnText(stmt, 8);
        e.cluster              = columnText(stmt, 9);
        e.namespaceName        = columnOptionalText(stmt, 10);
        if (auto c = columnOptionalInt(stmt, 11)) e.exitCode = static_cast<int>(*c);
        e.stdoutText           = columnText(stmt, 12);
        e.stderrText           = columnText(stmt, 13);
        e.durationMs           = columnOptionalInt(stmt, 14);
        e.userAction           = userActionFromString(columnText(stmt, 15))
                                     .value_or(UserAction::Cancelled);
        entries.push_back(std::move(e));
    }

    sqlite3_finalize(stmt);
    return entries;
}

int AuditLog::sweepRetention(int days) {
    std::lock_guard lock(dbMutex_);
    return sweepLocked(days);
}

int AuditLog::sweepLocked(int days) {
    if (!db_ || days <= 0) return 0;

    int64_t cutoff = currentTimestamp() - static_cast<int64_t>(days) * 86400;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM audit_log WHERE timestamp < ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare retention sweep: {}", sqlite3_errmsg(db_));
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, cutoff);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        spdlog::warn("Retention sweep failed: {}", sqlite3_errmsg(db_));
        return -1;
    }
    int removed = sqlite3_changes(db_);
    spdlog::info("Retention sweep removed {} audit entries older than {} days",
                 removed, days);
    return removed;
}

int64_t AuditLog::count() const {
    std::lock_guard lock(dbMutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM audit_log", -1, &stmt,
                           nullptr) != SQLITE_OK)
        return 0;
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

int64_t AuditLog::currentTimestamp() {
    return static_cast<int64_t>(std::time(nullptr));
}

std::string AuditLog::currentUser() {
    if (struct passwd* pw = getpwuid(getuid()); pw && pw->pw_name)
        return pw->pw_name;
    if (const char* u = std::getenv("USER")) return u;
    return "unknown";
}

std::string AuditLog::truncateOutput(const std::string& text, size_t cap) {
    if (text.size() <= cap) return text;
    return text.substr(0, cap) + CommandExecutor::kTruncationMarker;
}
