#include "translate/PromptBuilder.hpp"
#include <sstream>

std::string PromptBuilder::buildSystemPrompt(const EnvironmentContext& ctx) const {
    const std::string ns  = ctx.effectiveNamespace();
    const std::string env = environmentClassToString(ctx.environmentClass);

    std::ostringstream ops;
    for (size_t i = 0; i < operations_.size(); i++) {
        if (i) ops << ", ";
        ops << operations_[i];
    }

    std::ostringstream out;
    out << "You are a " << toolPrefix_ << " expert assistant. Translate natural "
           "language requests into valid " << toolPrefix_ << " commands.\n\n"
        << "CURRENT CONTEXT:\n"
        << "- Cluster: " << ctx.cluster << "\n"
        << "- Namespace: " << ns << "\n"
        << "- Environment: " << env << "\n\n"
        << "SUPPORTED OPERATIONS:\n" << ops.str() << "\n\n"
        << R"(RULES:
1. Return ONLY valid JSON with this exact structure:
   {"command": ")" << toolPrefix_ << R"( [subcommand] [args]", "confidence": <0-100>, "rationale": "<explanation>"}

2. If the request is ambiguous (missing pod name, namespace, resource type),
   set confidence below 70 and include "NEEDS_CLARIFICATION: [specific question]"
   in rationale.

3. Always use the current namespace unless the user explicitly names another
   with "-n" or "--namespace".

4. Never return commands that:
   - use absolute paths or file references
   - include shell pipes, redirects or command chaining
   - use an operation outside SUPPORTED OPERATIONS

5. For destructive operations (delete, drain) the resource name must be given
   explicitly. If it is not, set confidence below 70.

EXAMPLES:
User: "show all pods"
Response: {"command": ")" << toolPrefix_ << " get pods -n " << ns
        << R"(", "confidence": 95, "rationale": "Standard pod listing in current namespace"}

User: "delete deployment nginx"
Response: {"command": ")" << toolPrefix_ << " delete deployment nginx -n " << ns
        << R"(", "confidence": 90, "rationale": "Explicit deployment deletion with resource name provided"}

User: "show logs"
Response: {"command": ")" << toolPrefix_ << R"( logs", "confidence": 40, "rationale": "NEEDS_CLARIFICATION: Which pod?"}

User: "scale my api to 5"
Response: {"command": ")" << toolPrefix_ << " scale deployment api --replicas=5 -n " << ns
        << R"(", "confidence": 75, "rationale": "Assuming 'api' is a deployment name"})";

    return out.str();
}

std::string PromptBuilder::buildUserPrompt(const std::string& input,
                                           const EnvironmentContext& ctx) const {
    std::ostringstream out;
    out << "Natural language request: \"" << input << "\"\n\n"
        << "Context reminder:\n"
        << "- Current cluster: " << ctx.cluster << "\n"
        << "- Current namespace: " << ctx.effectiveNamespace() << "\n"
        << "- Environment type: "
        << environmentClassToString(ctx.environmentClass) << "\n\n"
        << "Provide your response as JSON with command, confidence, and "
           "rationale fields.";
    return out.str();
}
