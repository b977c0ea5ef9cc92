#pragma once

/// @file pattern_catalog.h
/// @brief Static table of categorized detection rules
///
/// The catalog is pure data. Engines walk it generically in declaration
/// order, so adding a detection signal means adding a row here and nothing
/// else. Expressions use RE2 syntax, which has no lookaround; a rule that
/// must reject some match starts carries a separate exclusion expression.

#include <string>
#include <vector>

#include "guardian/types.h"

namespace flowguard::guardian {

/// @brief A secret/PII rule. When the expression has a capture group, the
///        group is the value to redact and the rest is context.
struct SensitivePattern {
    SensitiveType type;
    const char* expression;
    bool case_insensitive;

    /// Matches anchored at a match start that discard that start
    const char* exclusion = nullptr;
};

/// @brief A prompt-injection rule. Always matched case-insensitively.
struct InjectionPattern {
    InjectionType type;
    const char* expression;
    Severity severity;
};

/// @brief Prefix shared by every redaction token
extern const char kRedactionTokenPrefix[];

/// @brief Expression matching a complete redaction token
extern const char kRedactionTokenExpression[];

/// @brief Secret and PII rules, grouped by type in catalog order
const std::vector<SensitivePattern>& SensitivePatterns();

/// @brief Injection rules, grouped by type in catalog order
const std::vector<InjectionPattern>& InjectionPatterns();

/// @brief Human-readable description used in matches and flags
std::string InjectionDescription(InjectionType type);

/// @brief Build "[REDACTED_<TYPE>_<n>]"
std::string MakeRedactionToken(SensitiveType type, int sequence);

}  // namespace flowguard::guardian
