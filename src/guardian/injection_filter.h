#pragma once

/// @file injection_filter.h
/// @brief Prompt-injection detection over untrusted text
///
/// Detects adversarial instructions hidden in code, comments or logs that
/// are later handed to an AI agent:
/// - Instruction overrides ("ignore previous instructions")
/// - Role hijacking ("you are now a different assistant")
/// - Context manipulation ("the real task is")
/// - Chat-template delimiters (`<|im_start|>`, `[INST]`)
/// - Encoded payloads

#include <memory>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <re2/re2.h>

#include "guardian/guardian_config.h"
#include "guardian/types.h"

namespace flowguard::guardian {

/// @brief Line-oriented prompt-injection filter
///
/// Only patterns whose severity is allowed by the configured sensitivity
/// are compiled. Immutable after Initialize().
class InjectionFilter {
public:
    explicit InjectionFilter(InjectionFilterConfig config = {});
    ~InjectionFilter();

    // Disable copy
    InjectionFilter(const InjectionFilter&) = delete;
    InjectionFilter& operator=(const InjectionFilter&) = delete;

    /// @brief Compile the patterns allowed by the sensitivity
    absl::Status Initialize();

    bool IsInitialized() const { return initialized_; }

    /// @brief Scan every line against every allowed pattern
    /// @return All matches in catalog order and the aggregated risk score
    absl::StatusOr<InjectionResult> Scan(const std::string& text) const;

    /// @brief Check if text is safe (quick check)
    /// @return true if no allowed pattern matches anywhere
    bool QuickCheck(const std::string& text) const;

    /// @brief One human-readable flag per distinct injection type
    /// @return Empty when the text is safe
    absl::StatusOr<std::vector<std::string>> GetSecurityFlags(const std::string& text) const;

    Sensitivity GetSensitivity() const { return config_.sensitivity; }

    /// @brief min(1.0, sum of severity weights / 3.0)
    static double CalculateRiskScore(const std::vector<InjectionMatch>& matches);

private:
    struct CompiledPattern {
        std::unique_ptr<re2::RE2> regex;
        InjectionType type;
        Severity severity;
    };

    InjectionFilterConfig config_;
    std::vector<CompiledPattern> patterns_;
    bool initialized_ = false;
};

}  // namespace flowguard::guardian
