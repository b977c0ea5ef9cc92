/// @file types_test.cpp
/// @brief Tests for guardian enums, conversions and JSON shapes

#include <gtest/gtest.h>

#include "guardian/types.h"

namespace flowguard::guardian {
namespace {

// ============================================================================
// Conversions
// ============================================================================

TEST(TypesTest, SensitiveTypeNames) {
    EXPECT_EQ(SensitiveTypeToString(SensitiveType::kApiKey), "api_key");
    EXPECT_EQ(SensitiveTypeToString(SensitiveType::kAwsKey), "aws_key");
    EXPECT_EQ(SensitiveTypeToString(SensitiveType::kGithubToken), "github_token");
    EXPECT_EQ(SensitiveTypeToString(SensitiveType::kCreditCard), "credit_card");
    EXPECT_EQ(SensitiveTypeToString(SensitiveType::kIpAddress), "ip_address");
}

TEST(TypesTest, InjectionTypeNames) {
    EXPECT_EQ(InjectionTypeToString(InjectionType::kInstructionOverride), "instruction_override");
    EXPECT_EQ(InjectionTypeToString(InjectionType::kDelimiterAttack), "delimiter_attack");
    EXPECT_EQ(InjectionTypeToString(InjectionType::kEncodedInjection), "encoded_injection");
}

TEST(TypesTest, ParseSensitivity) {
    EXPECT_EQ(*ParseSensitivity("low"), Sensitivity::kLow);
    EXPECT_EQ(*ParseSensitivity("Medium"), Sensitivity::kMedium);
    EXPECT_EQ(*ParseSensitivity("HIGH"), Sensitivity::kHigh);

    auto unknown = ParseSensitivity("extreme");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(TypesTest, SecretSubset) {
    EXPECT_TRUE(IsSecretType(SensitiveType::kApiKey));
    EXPECT_TRUE(IsSecretType(SensitiveType::kAwsKey));
    EXPECT_TRUE(IsSecretType(SensitiveType::kGithubToken));
    EXPECT_TRUE(IsSecretType(SensitiveType::kPrivateKey));
    EXPECT_TRUE(IsSecretType(SensitiveType::kSecret));
    EXPECT_TRUE(IsSecretType(SensitiveType::kPassword));

    EXPECT_FALSE(IsSecretType(SensitiveType::kEmail));
    EXPECT_FALSE(IsSecretType(SensitiveType::kPhone));
    EXPECT_FALSE(IsSecretType(SensitiveType::kSsn));
    EXPECT_FALSE(IsSecretType(SensitiveType::kCreditCard));
    EXPECT_FALSE(IsSecretType(SensitiveType::kIpAddress));
}

TEST(TypesTest, SeverityWeights) {
    EXPECT_DOUBLE_EQ(SeverityWeight(Severity::kHigh), 1.0);
    EXPECT_DOUBLE_EQ(SeverityWeight(Severity::kMedium), 0.5);
    EXPECT_DOUBLE_EQ(SeverityWeight(Severity::kLow), 0.2);
}

TEST(TypesTest, SensitivityPolicyIsNested) {
    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kLow, Severity::kHigh));
    EXPECT_FALSE(IsSeverityAllowed(Sensitivity::kLow, Severity::kMedium));
    EXPECT_FALSE(IsSeverityAllowed(Sensitivity::kLow, Severity::kLow));

    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kMedium, Severity::kHigh));
    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kMedium, Severity::kMedium));
    EXPECT_FALSE(IsSeverityAllowed(Sensitivity::kMedium, Severity::kLow));

    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kHigh, Severity::kHigh));
    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kHigh, Severity::kMedium));
    EXPECT_TRUE(IsSeverityAllowed(Sensitivity::kHigh, Severity::kLow));
}

TEST(TypesTest, TruncateForDisplay) {
    const std::string exact(50, 'x');
    EXPECT_EQ(TruncateForDisplay(exact), exact);

    const std::string long_text(60, 'y');
    EXPECT_EQ(TruncateForDisplay(long_text), std::string(50, 'y') + "...");
}

// ============================================================================
// Serialization
// ============================================================================

TEST(TypesTest, SanitizationResultJson) {
    SanitizationResult result;
    result.sanitized_text = "key=[REDACTED_API_KEY_1]";
    result.secrets_detected = true;

    RedactedItem item;
    item.sensitive_type = SensitiveType::kApiKey;
    item.original_length = 24;
    item.line_number = 3;
    item.token = "[REDACTED_API_KEY_1]";
    result.redacted_items.push_back(item);

    auto j = result.ToJson();
    EXPECT_EQ(j["sanitized_text"], "key=[REDACTED_API_KEY_1]");
    EXPECT_EQ(j["redacted_count"], 1);
    EXPECT_EQ(j["secrets_detected"], true);
    EXPECT_EQ(j["pii_detected"], false);
    ASSERT_EQ(j["redacted_items"].size(), 1u);
    EXPECT_EQ(j["redacted_items"][0]["type"], "api_key");
    EXPECT_EQ(j["redacted_items"][0]["original_length"], 24);
    EXPECT_EQ(j["redacted_items"][0]["line_number"], 3);
    EXPECT_EQ(j["redacted_items"][0]["token"], "[REDACTED_API_KEY_1]");
}

TEST(TypesTest, InjectionResultJson) {
    InjectionResult result;
    result.is_safe = false;
    result.risk_score = 0.5;

    InjectionMatch match;
    match.injection_type = InjectionType::kEncodedInjection;
    match.matched_text = std::string(80, 'Q');
    match.line_number = 7;
    match.severity = Severity::kLow;
    match.description = "Potentially encoded malicious content";
    result.matches.push_back(match);

    auto j = result.ToJson();
    EXPECT_EQ(j["is_safe"], false);
    EXPECT_DOUBLE_EQ(j["risk_score"].get<double>(), 0.5);
    EXPECT_EQ(j["injection_count"], 1);
    ASSERT_EQ(j["matches"].size(), 1u);
    EXPECT_EQ(j["matches"][0]["type"], "encoded_injection");
    EXPECT_EQ(j["matches"][0]["severity"], "low");
    EXPECT_EQ(j["matches"][0]["line_number"], 7);
    EXPECT_EQ(j["matches"][0]["matched_text"], std::string(50, 'Q') + "...");

    // The struct keeps the full text
    EXPECT_EQ(result.matches[0].matched_text.size(), 80u);
}

TEST(TypesTest, EmptyResultsSerialize) {
    auto sanitized = SanitizationResult{}.ToJson();
    EXPECT_EQ(sanitized["redacted_count"], 0);
    EXPECT_TRUE(sanitized["redacted_items"].is_array());

    auto injection = InjectionResult{}.ToJson();
    EXPECT_EQ(injection["is_safe"], true);
    EXPECT_TRUE(injection["matches"].empty());
}

}  // namespace
}  // namespace flowguard::guardian
