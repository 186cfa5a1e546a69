#pragma once
#include "safety/RiskLevel.hpp"
#include <cstdint>
#include <ctime>
#include <limits>
#include <optional>
#include <string>

enum class UserAction {
    Executed,
    Cancelled,
    Edited      // executed after the operator changed the proposal
};

inline const char* userActionToString(UserAction a) {
    switch (a) {
        case UserAction::Executed:  return "Executed";
        case UserAction::Cancelled: return "Cancelled";
        case UserAction::Edited:    return "Edited";
    }
    return "Cancelled";
}

inline std::optional<UserAction> userActionFromString(const std::string& s) {
    if (s == "Executed")  return UserAction::Executed;
    if (s == "Cancelled") return UserAction::Cancelled;
    if (s == "Edited")    return UserAction::Edited;
    return std::nullopt;
}

// One attempt, whatever its outcome. Never mutated once written.
struct AuditLogEntry {
    int64_t     id        = 0;    // assigned by the store
    int64_t     timestamp = 0;    // unix seconds; 0 = stamp on write
    std::string userId;
    std::string naturalLanguageInput;
    std::string finalCommand;
    std::optional<std::string> originalCommand;  // AI proposal when Edited
    std::optional<int>         confidence;       // null for direct entry
    RiskLevel   riskLevel = RiskLevel::Low;
    std::string environmentName;
    std::string cluster;
    std::optional<std::string> namespaceName;
    std::optional<int>         exitCode;         // null when Cancelled
    std::string stdoutText;
    std::string stderrText;
    std::optional<long long>   durationMs;
    UserAction  userAction = UserAction::Cancelled;
};

// Bounded query shapes served by the timestamp / environment indexes.
struct AuditFilter {
    enum class Kind { Recent, DateRange, Environment };

    Kind        kind = Kind::Recent;
    int64_t     from = 0;                                    // inclusive
    int64_t     to   = std::numeric_limits<int64_t>::max();  // exclusive
    std::string environment;
    size_t      limit  = 20;
    size_t      offset = 0;

    static AuditFilter recent(size_t limit = 20) {
        AuditFilter f;
        f.limit = limit;
        return f;
    }

    static AuditFilter between(int64_t from, int64_t to, size_t limit = 20) {
        AuditFilter f;
        f.kind  = Kind::DateRange;
        f.from  = from;
        f.to    = to;
        f.limit = limit;
        return f;
    }

    // Since local midnight.
    static AuditFilter today(size_t limit = 20) {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        local.tm_hour = 0;
        local.tm_min  = 0;
        local.tm_sec  = 0;
        local.tm_isdst = -1;
        return between(static_cast<int64_t>(std::mktime(&local)),
                       std::numeric_limits<int64_t>::max(), limit);
    }

    static AuditFilter lastDays(int days, size_t limit = 20) {
        int64_t now = static_cast<int64_t>(std::time(nullptr));
        return between(now - static_cast<int64_t>(days) * 86400,
                       std::numeric_limits<int64_t>::max(), limit);
    }

    static AuditFilter forEnvironment(std::string name, size_t limit = 20) {
        AuditFilter f;
        f.kind        = Kind::Environment;
        f.environment = std::move(name);
        f.limit       = limit;
        return f;
    }
};
