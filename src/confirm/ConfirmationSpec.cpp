#include "confirm/ConfirmationSpec.hpp"
#include "util/CommandLine.hpp"
#include <set>
#include <sstream>

namespace {

// Flags whose value is the following word.
const std::set<std::string> kValueFlags = {
    "-n", "--namespace", "-l", "--selector", "-f", "--filename",
    "-o", "--output", "-c", "--container", "--context", "--cluster",
    "--user", "--field-selector", "--grace-period", "--timeout",
    "--replicas",
};

} // namespace

std::string ConfirmationSpec::extractResourceName(const std::string& command,
                                                  EnvironmentClass env)
{
    std::vector<std::string> words;
    if (auto argv = splitCommandLine(command)) {
        words = std::move(*argv);
    } else {
        std::istringstream in(command);
        std::string w;
        while (in >> w) words.push_back(w);
    }

    // words[0] is the tool, words[1] the verb
    std::vector<std::string> positional;
    for (size_t i = 2; i < words.size(); i++) {
        const auto& word = words[i];
        if (!word.empty() && word[0] == '-') {
            if (word.find('=') == std::string::npos && kValueFlags.count(word))
                i++;
            continue;
        }
        positional.push_back(word);
    }

    auto afterSlash = [](const std::string& s) {
        auto pos = s.find('/');
        return pos == std::string::npos ? s : s.substr(pos + 1);
    };

    std::string name;
    if (positional.size() >= 2)
        name = afterSlash(positional[1]);
    else if (positional.size() == 1 && positional[0] != "all")
        name = afterSlash(positional[0]);

    if (name.empty() || name == "all")
        return environmentClassToString(env);
    return name;
}
