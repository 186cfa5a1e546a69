#pragma once
#include <string>
#include <unordered_set>
#include <vector>

// Persisted set of exact command strings the operator has approved with
// "allow always". Plain text, one command per line, '#' comments ignored.
// Loaded once at startup and owned by the main loop.
class Allowlist {
public:
    explicit Allowlist(std::string path);

    // Missing file is not an error (empty allowlist).
    bool load();

    bool isAllowed(const std::string& command) const;

    // Appends to the file. Returns false if the write failed; the
    // in-memory set is only updated on success.
    bool add(const std::string& command);

    // Rewrites the file atomically (temp file + rename).
    bool remove(const std::string& command);

    const std::vector<std::string>& entries() const { return ordered_; }
    size_t size() const { return ordered_.size(); }
    const std::string& path() const { return path_; }

    static std::string normalize(const std::string& command);

private:
    std::string path_;
    std::vector<std::string> ordered_;
    std::unordered_set<std::string> lookup_;
};
