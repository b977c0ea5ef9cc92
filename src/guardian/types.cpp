/// @file types.cpp
/// @brief Guardian type conversions and JSON serialization

#include "guardian/types.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace flowguard::guardian {

using json = nlohmann::json;

// ============================================================================
// Serialization
// ============================================================================

json RedactedItem::ToJson() const {
    json j;
    j["type"] = SensitiveTypeToString(sensitive_type);
    j["original_length"] = original_length;
    j["line_number"] = line_number;
    j["token"] = token;
    return j;
}

json SanitizationResult::ToJson() const {
    json j;
    j["sanitized_text"] = sanitized_text;
    j["redacted_count"] = redacted_items.size();
    j["pii_detected"] = pii_detected;
    j["secrets_detected"] = secrets_detected;

    json items = json::array();
    for (const auto& item : redacted_items) {
        items.push_back(item.ToJson());
    }
    j["redacted_items"] = std::move(items);
    return j;
}

json InjectionMatch::ToJson() const {
    json j;
    j["type"] = InjectionTypeToString(injection_type);
    j["matched_text"] = TruncateForDisplay(matched_text);
    j["line_number"] = line_number;
    j["severity"] = SeverityToString(severity);
    j["description"] = description;
    return j;
}

json InjectionResult::ToJson() const {
    json j;
    j["is_safe"] = is_safe;
    j["risk_score"] = risk_score;
    j["injection_count"] = matches.size();

    json items = json::array();
    for (const auto& match : matches) {
        items.push_back(match.ToJson());
    }
    j["matches"] = std::move(items);
    return j;
}

// ============================================================================
// Conversions
// ============================================================================

std::string SensitiveTypeToString(SensitiveType type) {
    switch (type) {
        case SensitiveType::kApiKey: return "api_key";
        case SensitiveType::kSecret: return "secret";
        case SensitiveType::kPassword: return "password";
        case SensitiveType::kEmail: return "email";
        case SensitiveType::kPhone: return "phone";
        case SensitiveType::kSsn: return "ssn";
        case SensitiveType::kCreditCard: return "credit_card";
        case SensitiveType::kIpAddress: return "ip_address";
        case SensitiveType::kAwsKey: return "aws_key";
        case SensitiveType::kGithubToken: return "github_token";
        case SensitiveType::kPrivateKey: return "private_key";
    }
    return "unknown";
}

std::string InjectionTypeToString(InjectionType type) {
    switch (type) {
        case InjectionType::kInstructionOverride: return "instruction_override";
        case InjectionType::kRoleHijacking: return "role_hijacking";
        case InjectionType::kContextManipulation: return "context_manipulation";
        case InjectionType::kDelimiterAttack: return "delimiter_attack";
        case InjectionType::kEncodedInjection: return "encoded_injection";
    }
    return "unknown";
}

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kLow: return "low";
        case Severity::kMedium: return "medium";
        case Severity::kHigh: return "high";
    }
    return "unknown";
}

std::string SensitivityToString(Sensitivity sensitivity) {
    switch (sensitivity) {
        case Sensitivity::kLow: return "low";
        case Sensitivity::kMedium: return "medium";
        case Sensitivity::kHigh: return "high";
    }
    return "unknown";
}

absl::StatusOr<Sensitivity> ParseSensitivity(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "low") return Sensitivity::kLow;
    if (lower == "medium") return Sensitivity::kMedium;
    if (lower == "high") return Sensitivity::kHigh;
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown sensitivity '", absl::string_view(name.data(), name.size()), "' (expected low, medium or high)"));
}

bool IsSecretType(SensitiveType type) {
    switch (type) {
        case SensitiveType::kApiKey:
        case SensitiveType::kAwsKey:
        case SensitiveType::kGithubToken:
        case SensitiveType::kPrivateKey:
        case SensitiveType::kSecret:
        case SensitiveType::kPassword:
            return true;
        case SensitiveType::kEmail:
        case SensitiveType::kPhone:
        case SensitiveType::kSsn:
        case SensitiveType::kCreditCard:
        case SensitiveType::kIpAddress:
            return false;
    }
    return true;
}

double SeverityWeight(Severity severity) {
    switch (severity) {
        case Severity::kHigh: return 1.0;
        case Severity::kMedium: return 0.5;
        case Severity::kLow: return 0.2;
    }
    return 0.5;
}

bool IsSeverityAllowed(Sensitivity sensitivity, Severity severity) {
    switch (sensitivity) {
        case Sensitivity::kLow:
            return severity == Severity::kHigh;
        case Sensitivity::kMedium:
            return severity == Severity::kHigh || severity == Severity::kMedium;
        case Sensitivity::kHigh:
            return true;
    }
    return false;
}

std::string TruncateForDisplay(const std::string& text) {
    if (text.size() <= kMaxDisplayedMatchLength) {
        return text;
    }
    return absl::StrCat(text.substr(0, kMaxDisplayedMatchLength), "...");
}

}  // namespace flowguard::guardian
