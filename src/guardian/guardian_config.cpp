/// @file guardian_config.cpp
/// @brief Guardian configuration loading and validation

#include "guardian/guardian_config.h"

#include <cstdint>
#include <string>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "guardian/regex_matcher.h"

namespace flowguard::guardian {

namespace {

const char kEnableHighEntropyKey[] = "guardian.sanitizer.enable_high_entropy";
const char kEntropyThresholdKey[] = "guardian.sanitizer.entropy_threshold";
const char kMinSecretLengthKey[] = "guardian.sanitizer.min_secret_length";
const char kMaxSecretLengthKey[] = "guardian.sanitizer.max_secret_length";
const char kSensitivityKey[] = "guardian.injection.sensitivity";

absl::StatusOr<size_t> ToLength(const char* key, int64_t value) {
    if (value <= 0) {
        return ConfigurationError(
            absl::StrCat(key, " must be positive, got ", value));
    }
    return static_cast<size_t>(value);
}

}  // namespace

GuardianConfig GuardianConfig::Default() {
    return GuardianConfig{};
}

absl::StatusOr<GuardianConfig> GuardianConfig::FromConfig(const Config& config) {
    GuardianConfig result = Default();

    // Sanitizer section
    FLOWGUARD_ASSIGN_OR_RETURN(auto high_entropy, config.Lookup<bool>(kEnableHighEntropyKey));
    if (high_entropy) {
        result.sanitizer.enable_high_entropy = *high_entropy;
    }

    FLOWGUARD_ASSIGN_OR_RETURN(auto threshold, config.Lookup<double>(kEntropyThresholdKey));
    if (threshold) {
        result.sanitizer.entropy_threshold = *threshold;
    }

    FLOWGUARD_ASSIGN_OR_RETURN(auto min_length, config.Lookup<int64_t>(kMinSecretLengthKey));
    if (min_length) {
        FLOWGUARD_ASSIGN_OR_RETURN(result.sanitizer.min_secret_length,
                                   ToLength(kMinSecretLengthKey, *min_length));
    }

    FLOWGUARD_ASSIGN_OR_RETURN(auto max_length, config.Lookup<int64_t>(kMaxSecretLengthKey));
    if (max_length) {
        FLOWGUARD_ASSIGN_OR_RETURN(result.sanitizer.max_secret_length,
                                   ToLength(kMaxSecretLengthKey, *max_length));
    }

    // Injection section
    FLOWGUARD_ASSIGN_OR_RETURN(auto sensitivity, config.Lookup<std::string>(kSensitivityKey));
    if (sensitivity) {
        auto parsed = ParseSensitivity(*sensitivity);
        if (!parsed.ok()) {
            return Annotate(parsed.status(), kSensitivityKey);
        }
        result.injection.sensitivity = *parsed;
    }

    FLOWGUARD_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::StatusOr<GuardianConfig> GuardianConfig::LoadWithEnv(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {
    FLOWGUARD_ASSIGN_OR_RETURN(Config config, Config::LoadLayered(path, env_prefix));
    FLOWGUARD_ASSIGN_OR_RETURN(GuardianConfig result, FromConfig(config));

    FLOWGUARD_LOG_DEBUG(
        "Guardian config: sensitivity={}, entropy={}, threshold={}, length=[{}, {}]",
        SensitivityToString(result.injection.sensitivity),
        result.sanitizer.enable_high_entropy,
        result.sanitizer.entropy_threshold,
        result.sanitizer.min_secret_length,
        result.sanitizer.max_secret_length);
    return result;
}

absl::Status GuardianConfig::Validate() const {
    if (sanitizer.min_secret_length == 0) {
        return ConfigurationError("min_secret_length must be positive");
    }
    if (sanitizer.max_secret_length > static_cast<size_t>(kMaxRepetition)) {
        return ConfigurationError(absl::StrCat(
            "max_secret_length must not exceed ", kMaxRepetition, ", got ",
            sanitizer.max_secret_length));
    }
    if (sanitizer.min_secret_length > sanitizer.max_secret_length) {
        return ConfigurationError(absl::StrCat(
            "min_secret_length (", sanitizer.min_secret_length,
            ") exceeds max_secret_length (", sanitizer.max_secret_length, ")"));
    }
    // log2(256) is the ceiling for byte entropy
    if (!(sanitizer.entropy_threshold > 0.0) || sanitizer.entropy_threshold > 8.0) {
        return ConfigurationError(absl::StrCat(
            "entropy_threshold must be in (0, 8], got ", sanitizer.entropy_threshold));
    }
    return absl::OkStatus();
}

}  // namespace flowguard::guardian
