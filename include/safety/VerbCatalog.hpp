#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Lexical risk vocabulary for the target tool. Treated as data: the
// defaults can be replaced from the "risk" section of the config file.
//
// An entry is one or more whitespace-separated tokens; it matches when
// every token appears in the command. "scale --replicas=0" therefore
// only fires for a scale that also carries a zero replica count.
struct VerbCatalog {
    std::vector<std::string> highVerbs;
    std::vector<std::string> mediumVerbs;

    // Closed catalog of operations advertised to the translation backend.
    std::vector<std::string> operations;

    static VerbCatalog defaults() {
        VerbCatalog c;
        c.highVerbs = {
            "delete", "drain",
            "scale --replicas=0",
            "replace --force",
        };
        c.mediumVerbs = {
            "apply", "create", "patch", "edit", "scale", "rollout",
            "restart", "label", "annotate", "cordon", "uncordon", "taint",
            "set", "replace", "cp", "exec", "port-forward", "run",
            "expose", "autoscale",
        };
        c.operations = {
            "get", "describe", "logs", "delete", "scale", "apply", "create",
            "patch", "edit", "exec", "port-forward", "drain", "cordon",
            "uncordon", "top", "rollout", "label", "annotate", "cp", "auth",
        };
        return c;
    }

    // Missing lists keep their defaults.
    static VerbCatalog fromJson(const nlohmann::json& j) {
        VerbCatalog c = defaults();
        if (!j.is_object()) return c;

        auto readList = [&](const char* key, std::vector<std::string>& out) {
            if (!j.contains(key) || !j[key].is_array()) return;
            std::vector<std::string> values;
            for (auto& v : j[key])
                if (v.is_string() && !v.get<std::string>().empty())
                    values.push_back(v.get<std::string>());
            if (!values.empty()) out = std::move(values);
        };

        readList("high_verbs",   c.highVerbs);
        readList("medium_verbs", c.mediumVerbs);
        readList("operations",   c.operations);
        return c;
    }
};
