#pragma once

/// @file types.h
/// @brief Shared types for the FlowGuard guardian layer
///
/// Every entity here is created and fully populated inside a single
/// Sanitize()/Scan() call and owned by the caller afterwards.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace flowguard::guardian {

/// @brief Category of sensitive content found by the sanitizer
enum class SensitiveType {
    kApiKey,
    kSecret,
    kPassword,
    kEmail,
    kPhone,
    kSsn,
    kCreditCard,
    kIpAddress,
    kAwsKey,
    kGithubToken,
    kPrivateKey
};

/// @brief Category of prompt-injection pattern
enum class InjectionType {
    kInstructionOverride,
    kRoleHijacking,
    kContextManipulation,
    kDelimiterAttack,
    kEncodedInjection
};

/// @brief Severity attached to each injection pattern
enum class Severity {
    kLow,
    kMedium,
    kHigh
};

/// @brief Injection filter policy selecting which severities count
enum class Sensitivity {
    kLow,     ///< high only
    kMedium,  ///< high and medium
    kHigh     ///< all severities
};

/// @brief One redacted span. The matched value itself is never kept.
struct RedactedItem {
    SensitiveType sensitive_type = SensitiveType::kSecret;
    size_t original_length = 0;
    size_t line_number = 0;  ///< 1-based
    std::string token;

    nlohmann::json ToJson() const;
};

/// @brief Result of Sanitizer::Sanitize
struct SanitizationResult {
    std::string sanitized_text;
    std::vector<RedactedItem> redacted_items;  ///< Document order, entropy hits last
    bool pii_detected = false;
    bool secrets_detected = false;

    nlohmann::json ToJson() const;
};

/// @brief One prompt-injection pattern hit
struct InjectionMatch {
    InjectionType injection_type = InjectionType::kInstructionOverride;
    std::string matched_text;  ///< Full match; ToJson() truncates for display
    size_t line_number = 0;    ///< 1-based
    Severity severity = Severity::kLow;
    std::string description;

    nlohmann::json ToJson() const;
};

/// @brief Result of InjectionFilter::Scan
struct InjectionResult {
    bool is_safe = true;
    std::vector<InjectionMatch> matches;
    double risk_score = 0.0;  ///< 0.0 - 1.0

    nlohmann::json ToJson() const;
};

/// @brief Maximum matched_text length shown in serialized injection matches
const size_t kMaxDisplayedMatchLength = 50;

// Conversions

/// @brief "api_key", "aws_key", ...
std::string SensitiveTypeToString(SensitiveType type);

/// @brief "instruction_override", "role_hijacking", ...
std::string InjectionTypeToString(InjectionType type);

/// @brief "low", "medium", "high"
std::string SeverityToString(Severity severity);

std::string SensitivityToString(Sensitivity sensitivity);

/// @brief Parse "low" / "medium" / "high" (case-insensitive)
absl::StatusOr<Sensitivity> ParseSensitivity(std::string_view name);

/// @brief True for the secret subset, false for PII
bool IsSecretType(SensitiveType type);

/// @brief Weight of one match of the given severity in the risk score
double SeverityWeight(Severity severity);

/// @brief Whether matches of `severity` count under `sensitivity`
bool IsSeverityAllowed(Sensitivity sensitivity, Severity severity);

/// @brief Truncate to kMaxDisplayedMatchLength characters plus "..."
std::string TruncateForDisplay(const std::string& text);

}  // namespace flowguard::guardian
