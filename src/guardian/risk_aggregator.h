#pragma once

/// @file risk_aggregator.h
/// @brief Combines sanitizer and injection filter signals into flags

#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "guardian/guardian_config.h"
#include "guardian/injection_filter.h"
#include "guardian/sanitizer.h"

namespace flowguard::guardian {

/// @brief Flag emitted when any secret-type redaction happened
extern const char kSecretsFlag[];

/// @brief Flag emitted when any PII-type redaction happened
extern const char kPiiFlag[];

/// @brief Single entry point of the guardian layer
///
/// Runs the sanitizer (only when its quick check reports a possible hit)
/// and the injection filter, and returns an ordered list of flag strings:
/// secrets, then PII, then one flag per injection type.
class RiskAggregator {
public:
    /// @brief Build and initialize both engines
    static absl::StatusOr<std::unique_ptr<RiskAggregator>> Create(
        const GuardianConfig& config = GuardianConfig::Default());

    ~RiskAggregator();

    // Disable copy
    RiskAggregator(const RiskAggregator&) = delete;
    RiskAggregator& operator=(const RiskAggregator&) = delete;

    /// @brief Scan text and return human-readable security flags
    /// @return Empty list when nothing was detected
    absl::StatusOr<std::vector<std::string>> ApplySecurityScan(const std::string& text) const;

    const Sanitizer& GetSanitizer() const { return *sanitizer_; }
    const InjectionFilter& GetInjectionFilter() const { return *injection_filter_; }

private:
    RiskAggregator(std::unique_ptr<Sanitizer> sanitizer,
                   std::unique_ptr<InjectionFilter> injection_filter);

    std::unique_ptr<Sanitizer> sanitizer_;
    std::unique_ptr<InjectionFilter> injection_filter_;
};

/// @brief ApplySecurityScan with a lazily built default aggregator
absl::StatusOr<std::vector<std::string>> ApplySecurityScan(const std::string& text);

}  // namespace flowguard::guardian
