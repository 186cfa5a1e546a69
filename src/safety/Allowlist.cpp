#include "safety/Allowlist.hpp"
#include "util/CommandLine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

Allowlist::Allowlist(std::string path)
    : path_(std::move(path)) {}

std::string Allowlist::normalize(const std::string& command) {
    auto begin = std::find_if(command.begin(), command.end(),
        [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(command.rbegin(), command.rend(),
        [](unsigned char c) { return !std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool Allowlist::load() {
    ordered_.clear();
    lookup_.clear();

    std::ifstream file(path_);
    if (!file.is_open()) {
        spdlog::debug("No allowlist at {}, starting empty", path_);
        return true;
    }

    std::string line;
    while (std::getline(file, line)) {
        auto cmd = normalize(line);
        if (cmd.empty() || cmd[0] == '#') continue;
        if (lookup_.insert(cmd).second)
            ordered_.push_back(cmd);
    }

    if (file.bad()) {
        spdlog::warn("Error reading allowlist {}", path_);
        return false;
    }

    spdlog::info("Loaded {} allowlisted commands from {}", ordered_.size(), path_);
    return true;
}

bool Allowlist::isAllowed(const std::string& command) const {
    return lookup_.count(normalize(command)) > 0;
}

bool Allowlist::add(const std::string& command) {
    auto cmd = normalize(command);
    if (cmd.empty() || cmd[0] == '#') return false;
    // One entry is one line of the file
    if (containsControlChars(cmd)) {
        spdlog::warn("Refusing to allowlist a command with control characters");
        return false;
    }
    if (lookup_.count(cmd)) return true;

    std::error_code ec;
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        spdlog::warn("Cannot open allowlist {} for writing", path_);
        return false;
    }

    // Single write of one complete line.
    std::string line = cmd + "\n";
    file.write(line.data(), static_cast<std::streamsize>(line.size()));
    file.flush();
    if (!file) {
        spdlog::warn("Failed to append to allowlist {}", path_);
        return false;
    }

    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);

    lookup_.insert(cmd);
    ordered_.push_back(cmd);
    spdlog::info("Allowlisted: {}", cmd);
    return true;
}

bool Allowlist::remove(const std::string& command) {
    auto cmd = normalize(command);
    if (!lookup_.count(cmd)) return false;

    std::vector<std::string> remaining;
    for (auto& c : ordered_)
        if (c != cmd) remaining.push_back(c);

    std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream tmp(tmpPath, std::ios::trunc);
        if (!tmp.is_open()) {
            spdlog::warn("Cannot write {}", tmpPath);
            return false;
        }
        tmp << "# kubeguard allowlist: one exact command per line\n";
        for (auto& c : remaining) tmp << c << "\n";
        tmp.flush();
        if (!tmp) {
            spdlog::warn("Failed writing {}", tmpPath);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path_, ec);
    if (ec) {
        spdlog::warn("Cannot replace allowlist {}: {}", path_, ec.message());
        fs::remove(tmpPath, ec);
        return false;
    }

    ordered_ = std::move(remaining);
    lookup_.erase(cmd);
    spdlog::info("Removed from allowlist: {}", cmd);
    return true;
}
