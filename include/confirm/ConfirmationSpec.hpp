#pragma once
#include "context/EnvironmentContext.hpp"
#include "safety/RiskLevel.hpp"
#include <string>
#include <vector>

enum class ConfirmationModality {
    None,
    YesNo,
    TypedPhrase
};

inline const char* confirmationModalityToString(ConfirmationModality m) {
    switch (m) {
        case ConfirmationModality::None:        return "none";
        case ConfirmationModality::YesNo:       return "yes/no";
        case ConfirmationModality::TypedPhrase: return "typed";
    }
    return "typed";
}

// How strongly the operator must acknowledge a command.
//   High   + production     -> TypedPhrase
//   High   + anything else  -> YesNo
//   Medium + any            -> YesNo
//   Low                     -> None
struct ConfirmationSpec {
    ConfirmationModality modality = ConfirmationModality::None;
    std::string          expectedPhrase;   // only for TypedPhrase

    static ConfirmationModality modalityFor(RiskLevel risk, EnvironmentClass env) {
        switch (risk) {
            case RiskLevel::High:
                return env == EnvironmentClass::Production
                    ? ConfirmationModality::TypedPhrase
                    : ConfirmationModality::YesNo;
            case RiskLevel::Medium:
                return ConfirmationModality::YesNo;
            case RiskLevel::Low:
                return ConfirmationModality::None;
        }
        return ConfirmationModality::TypedPhrase;
    }

    static ConfirmationSpec derive(const std::string& command, RiskLevel risk,
                                   EnvironmentClass env) {
        ConfirmationSpec spec;
        spec.modality = modalityFor(risk, env);
        if (spec.modality == ConfirmationModality::TypedPhrase)
            spec.expectedPhrase = extractResourceName(command, env);
        return spec;
    }

    // Resource name targeted by the command, e.g.
    //   "kubectl delete deployment nginx -n prod" -> "nginx"
    //   "kubectl delete deployment/nginx"         -> "nginx"
    //   "kubectl drain node-01"                   -> "node-01"
    // Falls back to the environment word when no name is present.
    static std::string extractResourceName(const std::string& command,
                                           EnvironmentClass env);
};
