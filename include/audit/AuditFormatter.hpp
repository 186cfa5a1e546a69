#pragma once
#include "AuditEntry.hpp"
#include <optional>
#include <string>
#include <vector>

// The "history" surface: argument parsing and the fixed-width table.
namespace AuditFormatter {

// Accepts: (none) | today | week | <N>d | env <name>, each optionally
// followed by a 1-based page number that sets the filter's offset.
// Returns nullopt and fills `error` on anything else.
std::optional<AuditFilter> parseHistoryArgs(const std::vector<std::string>& args,
                                            size_t pageSize,
                                            std::string& error);

std::string formatTable(const std::vector<AuditLogEntry>& entries);

// Local time, "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(int64_t unixSeconds);

std::string usage();

} // namespace AuditFormatter
