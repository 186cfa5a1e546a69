#include "audit/AuditFormatter.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace AuditFormatter {

namespace {

std::string fit(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, width);
    return s.substr(0, width - 3) + "...";
}

bool parseDays(const std::string& arg, int& days) {
    if (arg.size() < 2 || arg.back() != 'd') return false;
    for (size_t i = 0; i + 1 < arg.size(); i++)
        if (!std::isdigit(static_cast<unsigned char>(arg[i]))) return false;
    if (arg.size() > 6) return false;
    days = std::stoi(arg.substr(0, arg.size() - 1));
    return days > 0;
}

bool isNumber(const std::string& arg) {
    if (arg.empty()) return false;
    for (char c : arg)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

bool parsePage(const std::string& arg, size_t& page) {
    if (!isNumber(arg) || arg.size() > 6) return false;
    page = static_cast<size_t>(std::stoul(arg));
    return page > 0;
}

} // namespace

std::optional<AuditFilter> parseHistoryArgs(const std::vector<std::string>& args,
                                            size_t pageSize,
                                            std::string& error)
{
    // "env <name>" takes its page third; every other form takes it last
    std::vector<std::string> words = args;
    size_t page = 1;
    bool isEnv = !words.empty() && words[0] == "env";
    if ((isEnv && words.size() == 3) || (!isEnv && !words.empty() && isNumber(words.back()))) {
        if (!parsePage(words.back(), page)) {
            error = "Page must be a positive number, got '" + words.back() + "'. " + usage();
            return std::nullopt;
        }
        words.pop_back();
    }

    std::optional<AuditFilter> filter;
    if (words.empty()) {
        filter = AuditFilter::recent(pageSize);
    } else if (words[0] == "today" && words.size() == 1) {
        filter = AuditFilter::today(pageSize);
    } else if (words[0] == "week" && words.size() == 1) {
        filter = AuditFilter::lastDays(7, pageSize);
    } else if (isEnv) {
        if (words.size() != 2 || words[1].empty()) {
            error = "history env needs an environment name";
            return std::nullopt;
        }
        filter = AuditFilter::forEnvironment(words[1], pageSize);
    } else {
        int days = 0;
        if (words.size() == 1 && parseDays(words[0], days))
            filter = AuditFilter::lastDays(days, pageSize);
    }

    if (!filter) {
        error = "Unknown history filter '" + words[0] + "'. " + usage();
        return std::nullopt;
    }
    filter->offset = (page - 1) * pageSize;
    return filter;
}

std::string formatTimestamp(int64_t unixSeconds) {
    std::time_t t = static_cast<std::time_t>(unixSeconds);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string formatTable(const std::vector<AuditLogEntry>& entries) {
    if (entries.empty())
        return "No audit entries found.";

    std::ostringstream out;
    out << std::left
        << std::setw(6)  << "ID"
        << std::setw(20) << "Time"
        << std::setw(42) << "Command"
        << std::setw(16) << "Environment"
        << std::setw(10) << "Action"
        << "Exit\n"
        << std::string(98, '-') << "\n";

    for (auto& e : entries) {
        out << std::setw(6)  << e.id
            << std::setw(20) << formatTimestamp(e.timestamp)
            << std::setw(42) << fit(e.finalCommand, 40)
            << std::setw(16) << fit(e.environmentName, 14)
            << std::setw(10) << userActionToString(e.userAction)
            << (e.exitCode ? std::to_string(*e.exitCode) : "-") << "\n";
    }
    out << "\n" << entries.size() << " entr" << (entries.size() == 1 ? "y" : "ies");
    return out.str();
}

std::string usage() {
    return "Usage: history [today | week | <N>d | env <name>] [page]";
}

} // namespace AuditFormatter
