#pragma once
#include "TranslationTypes.hpp"
#include <string>

// Extracts and validates the structured answer from raw model text.
// Models often wrap the JSON object in prose or code fences, so the
// outermost {...} span is parsed. Never throws.
TranslationOutcome parseTranslationResponse(const std::string& raw,
                                            const std::string& toolPrefix);
