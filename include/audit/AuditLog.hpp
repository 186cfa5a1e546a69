#pragma once
#include "AuditEntry.hpp"
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

struct AuditWriteResult {
    bool        ok = false;
    int64_t     id = 0;
    std::string error;
};

// Append-only SQLite store of every command attempt.
//
// Writes are best-effort: a failed record() logs a warning and returns
// an error value, it never throws into the execution path.
class AuditLog {
public:
    struct Config {
        std::string databasePath;             // ":memory:" allowed
        int         retentionDays  = 90;      // <= 0 disables the sweep
        size_t      outputCapBytes = 10240;
        size_t      maxPageSize    = 100;
    };

    explicit AuditLog(const Config& config);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    // Opens/creates the database, applies the schema and runs the
    // retention sweep before any write is accepted.
    bool open();
    bool isOpen() const { return db_ != nullptr; }

    AuditWriteResult record(const AuditLogEntry& entry);

    // Most recent first; stable for equal timestamps (id breaks ties).
    std::vector<AuditLogEntry> query(const AuditFilter& filter) const;

    // Deletes entries older than `days`. Returns rows removed, -1 on error.
    int sweepRetention(int days);

    int64_t count() const;

    const Config& config() const { return config_; }

    static int64_t currentTimestamp();
    static std::string currentUser();
    static std::string truncateOutput(const std::string& text, size_t cap);

private:
    bool createSchema();
    int  sweepLocked(int days);  // caller holds dbMutex_

    Config config_;
    sqlite3* db_ = nullptr;
    mutable std::mutex dbMutex_;
};
