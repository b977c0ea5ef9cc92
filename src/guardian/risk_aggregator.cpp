/// @file risk_aggregator.cpp
/// @brief Risk aggregator implementation

#include "guardian/risk_aggregator.h"

#include "common/error.h"
#include "common/logging.h"

namespace flowguard::guardian {

const char kSecretsFlag[] = "⚠️ SECRETS: Potential secrets detected in diff";
const char kPiiFlag[] = "⚠️ PII: Personal information detected in diff";

absl::StatusOr<std::unique_ptr<RiskAggregator>> RiskAggregator::Create(
    const GuardianConfig& config) {
    FLOWGUARD_RETURN_IF_ERROR(config.Validate());

    auto sanitizer = std::make_unique<Sanitizer>(config.sanitizer);
    FLOWGUARD_RETURN_IF_ERROR(sanitizer->Initialize());

    auto injection_filter = std::make_unique<InjectionFilter>(config.injection);
    FLOWGUARD_RETURN_IF_ERROR(injection_filter->Initialize());

    return std::unique_ptr<RiskAggregator>(
        new RiskAggregator(std::move(sanitizer), std::move(injection_filter)));
}

RiskAggregator::RiskAggregator(std::unique_ptr<Sanitizer> sanitizer,
                               std::unique_ptr<InjectionFilter> injection_filter)
    : sanitizer_(std::move(sanitizer)),
      injection_filter_(std::move(injection_filter)) {}

RiskAggregator::~RiskAggregator() = default;

absl::StatusOr<std::vector<std::string>> RiskAggregator::ApplySecurityScan(
    const std::string& text) const {
    std::vector<std::string> flags;

    if (!sanitizer_->QuickCheck(text)) {
        FLOWGUARD_ASSIGN_OR_RETURN(SanitizationResult sanitized, sanitizer_->Sanitize(text));
        if (sanitized.secrets_detected) {
            flags.emplace_back(kSecretsFlag);
        }
        if (sanitized.pii_detected) {
            flags.emplace_back(kPiiFlag);
        }
    }

    FLOWGUARD_ASSIGN_OR_RETURN(std::vector<std::string> injection_flags,
                               injection_filter_->GetSecurityFlags(text));
    flags.insert(flags.end(), injection_flags.begin(), injection_flags.end());

    FLOWGUARD_LOG_DEBUG("Security scan produced {} flags", flags.size());
    return flags;
}

absl::StatusOr<std::vector<std::string>> ApplySecurityScan(const std::string& text) {
    static const absl::StatusOr<std::unique_ptr<RiskAggregator>> kDefaultAggregator =
        RiskAggregator::Create();
    if (!kDefaultAggregator.ok()) {
        return kDefaultAggregator.status();
    }
    return (*kDefaultAggregator)->ApplySecurityScan(text);
}

}  // namespace flowguard::guardian
