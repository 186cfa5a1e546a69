#pragma once
#include "context/EnvironmentContext.hpp"
#include <string>

// One operator submission. Carries its own copy of the context because
// it is handed to a worker thread.
struct TranslationRequest {
    std::string        text;
    EnvironmentContext context;
};

struct TranslationResult {
    static constexpr const char* kClarificationMarker = "NEEDS_CLARIFICATION";

    std::string command;      // always starts with the tool prefix
    int         confidence = 0;
    std::string rationale;

    bool isLowConfidence(int threshold) const { return confidence < threshold; }

    bool needsClarification() const {
        return rationale.find(kClarificationMarker) != std::string::npos;
    }

    // Text after "NEEDS_CLARIFICATION:" or the whole rationale.
    std::string clarificationQuestion() const {
        auto pos = rationale.find(kClarificationMarker);
        if (pos == std::string::npos) return rationale;
        auto q = rationale.substr(pos + std::string(kClarificationMarker).size());
        auto start = q.find_first_not_of(": \t");
        return start == std::string::npos ? rationale : q.substr(start);
    }
};

enum class TranslationError {
    None,
    InvalidRequest,   // rejected before any backend call
    Unavailable,      // timeout / unreachable / all backends failed
    Malformed         // backend answered but the answer failed validation
};

inline const char* translationErrorToString(TranslationError e) {
    switch (e) {
        case TranslationError::None:           return "none";
        case TranslationError::InvalidRequest: return "invalid_request";
        case TranslationError::Unavailable:    return "unavailable";
        case TranslationError::Malformed:      return "malformed";
    }
    return "unavailable";
}

struct TranslationOutcome {
    bool              ok = false;
    TranslationResult result;
    TranslationError  error = TranslationError::None;
    std::string       message;     // short, user-facing
    std::string       rationale;   // raw rationale when Malformed
    std::string       backend;     // which backend answered
    long long         latencyMs = 0;

    static TranslationOutcome success(TranslationResult r) {
        TranslationOutcome o;
        o.ok     = true;
        o.result = std::move(r);
        return o;
    }

    static TranslationOutcome failure(TranslationError e, std::string msg,
                                      std::string rationale = "") {
        TranslationOutcome o;
        o.error     = e;
        o.message   = std::move(msg);
        o.rationale = std::move(rationale);
        return o;
    }
};
