#pragma once
#include <cctype>
#include <optional>
#include <string>
#include <vector>

// Word splitting shared by everything that needs to agree on what argv a
// command line produces: the executor runs these words, the classifier
// and the confirmation phrase read the same ones.
//
// Single quotes are literal, double quotes honour backslash, a bare
// backslash escapes the next character. Adjacent quoted pieces join into
// one word ("del''ete" -> "delete"). No expansion of any kind.
// Returns nullopt on an unterminated quote.
inline std::optional<std::vector<std::string>> splitCommandLine(const std::string& command) {
    std::vector<std::string> args;
    std::string cur;
    bool inWord = false;
    char quote = 0;

    for (size_t i = 0; i < command.size(); i++) {
        char c = command[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < command.size()) {
                cur += command[++i];
            } else {
                cur += c;
            }
        } else if (c == '\'' || c == '"') {
            quote  = c;
            inWord = true;
        } else if (c == '\\' && i + 1 < command.size()) {
            cur += command[++i];
            inWord = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                args.push_back(cur);
                cur.clear();
                inWord = false;
            }
        } else {
            cur += c;
            inWord = true;
        }
    }
    if (quote) return std::nullopt;
    if (inWord) args.push_back(cur);
    return args;
}

// Newlines, NUL, ESC and the rest of the C0 range plus DEL. Tabs count too:
// a command is one line of printable text.
inline bool containsControlChars(const std::string& text) {
    for (unsigned char c : text)
        if (c < 0x20 || c == 0x7f) return true;
    return false;
}
