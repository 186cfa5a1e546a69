#pragma once
#include "RiskLevel.hpp"
#include "VerbCatalog.hpp"
#include "context/EnvironmentContext.hpp"
#include "util/CommandLine.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// Pure command-text classifier. No I/O, no allowlist lookups.
//
// First match wins: any high-risk entry => High, then any medium-risk
// entry => Medium, otherwise Low. Every token of the string is scanned,
// so a read chained with a write classifies at the write's tier. Tokens
// come from the same word split the executor uses, so quoting or
// escaping a verb does not hide it.
class RiskClassifier {
    struct Rule {
        std::vector<std::string> tokens;
    };

    std::vector<Rule> highRules_;
    std::vector<Rule> mediumRules_;

public:
    explicit RiskClassifier(const VerbCatalog& catalog = VerbCatalog::defaults()) {
        for (auto& v : catalog.highVerbs)   highRules_.push_back(makeRule(v));
        for (auto& v : catalog.mediumVerbs) mediumRules_.push_back(makeRule(v));
    }

    // The environment does not move the tier; it only changes how the
    // tier is confirmed (see ConfirmationSpec).
    RiskLevel classify(const std::string& command,
                       EnvironmentClass /*env*/ = EnvironmentClass::Unknown) const {
        // Nothing the executor would accept fails to split; never rate it Low
        if (!splitCommandLine(command)) return RiskLevel::High;

        auto tokens = tokenize(command);

        for (auto& rule : highRules_)
            if (matches(rule, tokens)) return RiskLevel::High;

        for (auto& rule : mediumRules_)
            if (matches(rule, tokens)) return RiskLevel::Medium;

        return RiskLevel::Low;
    }

    // Lower-cased tokens from two readings of the command, merged:
    //   - the raw text split on whitespace, quotes and shell separators
    //   - the argv the executor will run (quotes joined, escapes removed),
    //     each word also split on whitespace and shell separators
    // "--flag value" additionally yields "--flag=value" in both readings.
    static std::set<std::string> tokenize(const std::string& command) {
        static const std::regex separators(R"([\s;|&()`'"]+)");

        std::string lower = command;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        std::set<std::string> tokens;
        auto addPieces = [&](const std::string& text) {
            std::vector<std::string> parts;
            std::sregex_token_iterator it(text.begin(), text.end(), separators, -1);
            for (std::sregex_token_iterator end; it != end; ++it)
                if (it->length() > 0) parts.push_back(it->str());
            tokens.insert(parts.begin(), parts.end());
            return parts;
        };

        pairFlags(addPieces(lower), tokens);

        if (auto words = splitCommandLine(lower)) {
            for (auto& w : *words) {
                if (w.empty()) continue;
                tokens.insert(w);
                addPieces(w);
            }
            pairFlags(*words, tokens);
        }
        return tokens;
    }

private:
    static Rule makeRule(const std::string& entry) {
        Rule r;
        std::string lower = entry;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        std::istringstream in(lower);
        std::string tok;
        while (in >> tok) r.tokens.push_back(tok);
        return r;
    }

    static void pairFlags(const std::vector<std::string>& parts,
                          std::set<std::string>& tokens) {
        for (size_t i = 0; i + 1 < parts.size(); i++) {
            const auto& p = parts[i];
            if (p.size() > 2 && p.compare(0, 2, "--") == 0 &&
                p.find('=') == std::string::npos &&
                !parts[i + 1].empty() && parts[i + 1][0] != '-') {
                tokens.insert(p + "=" + parts[i + 1]);
            }
        }
    }

    static bool matches(const Rule& rule, const std::set<std::string>& tokens) {
        if (rule.tokens.empty()) return false;
        for (auto& t : rule.tokens)
            if (!tokens.count(t)) return false;
        return true;
    }
};
