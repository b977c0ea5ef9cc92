#pragma once

/// @file guardian_config.h
/// @brief Typed configuration for the guardian engines

#include <cstddef>
#include <filesystem>
#include <optional>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "guardian/types.h"

namespace flowguard::guardian {

/// @brief Sanitizer knobs
struct SanitizerConfig {
    /// Run the entropy pass over the sanitized text
    bool enable_high_entropy = true;

    /// Minimum Shannon entropy (bits per byte) for an entropy redaction
    double entropy_threshold = 4.5;

    /// Candidate token length bounds for the entropy pass
    size_t min_secret_length = 20;
    size_t max_secret_length = 64;
};

/// @brief Injection filter knobs
struct InjectionFilterConfig {
    Sensitivity sensitivity = Sensitivity::kMedium;
};

/// @brief Configuration of the whole guardian layer
///
/// YAML layout:
/// @code
///   guardian:
///     sanitizer:
///       enable_high_entropy: true
///       entropy_threshold: 4.5
///       min_secret_length: 20
///       max_secret_length: 64
///     injection:
///       sensitivity: medium
/// @endcode
struct GuardianConfig {
    SanitizerConfig sanitizer;
    InjectionFilterConfig injection;

    /// @brief Built-in defaults
    static GuardianConfig Default();

    /// @brief Read the `guardian.*` keys, falling back to defaults
    /// @return InvalidArgument for malformed or out-of-range values
    static absl::StatusOr<GuardianConfig> FromConfig(const Config& config);

    /// @brief Load an optional YAML file with FLOWGUARD_* overrides applied
    static absl::StatusOr<GuardianConfig> LoadWithEnv(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "FLOWGUARD_");

    /// @brief Check value ranges
    absl::Status Validate() const;
};

}  // namespace flowguard::guardian
