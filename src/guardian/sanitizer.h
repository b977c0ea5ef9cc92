#pragma once

/// @file sanitizer.h
/// @brief Secret and PII detection with redaction
///
/// Detects credentials and personal data using the pattern catalog and
/// replaces each match with a stable token of the form
/// `[REDACTED_<TYPE>_<n>]`. A supplementary entropy pass catches
/// random-looking strings that no catalog pattern names.

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <re2/re2.h>

#include "guardian/guardian_config.h"
#include "guardian/regex_matcher.h"
#include "guardian/types.h"

namespace flowguard::guardian {

/// @brief Secret/PII sanitizer
///
/// Immutable after Initialize(); Sanitize() and QuickCheck() may be called
/// concurrently on one instance. Token numbering is scoped to a single
/// Sanitize() call.
///
/// Example:
/// @code
///   Sanitizer sanitizer;
///   FLOWGUARD_RETURN_IF_ERROR(sanitizer.Initialize());
///
///   if (!sanitizer.QuickCheck(diff)) {
///       FLOWGUARD_ASSIGN_OR_RETURN(auto result, sanitizer.Sanitize(diff));
///       std::cout << result.sanitized_text;
///   }
/// @endcode
class Sanitizer {
public:
    explicit Sanitizer(SanitizerConfig config = {});
    ~Sanitizer();

    // Disable copy
    Sanitizer(const Sanitizer&) = delete;
    Sanitizer& operator=(const Sanitizer&) = delete;

    /// @brief Compile the catalog patterns
    /// @return Internal error if any pattern fails to compile
    absl::Status Initialize();

    bool IsInitialized() const { return initialized_; }

    /// @brief Detect and redact sensitive content
    /// @param text Arbitrary text (diff, file content, log)
    /// @return Sanitized text plus one RedactedItem per redaction
    absl::StatusOr<SanitizationResult> Sanitize(const std::string& text) const;

    /// @brief Cheap pre-check without the entropy pass
    /// @return true if no catalog pattern matches anywhere (safe)
    bool QuickCheck(const std::string& text) const;

    /// @brief Shannon entropy in bits per byte, 0 for empty input
    static double CalculateEntropy(std::string_view data);

    const SanitizerConfig& GetConfig() const { return config_; }

private:
    struct CompiledPattern {
        std::unique_ptr<re2::RE2> regex;
        std::unique_ptr<re2::RE2> exclusion;  // null when the rule has none
        SensitiveType type;
    };

    /// Candidate span in the input, before overlap resolution
    struct Candidate {
        size_t start;
        size_t end;
        SensitiveType type;
    };

    using Span = std::pair<size_t, size_t>;
    using TokenCounters = std::unordered_map<SensitiveType, int>;

    /// @brief Spans of redaction tokens already present in `text`
    std::vector<Span> FindTokenSpans(const std::string& text) const;

    /// @brief Next match of `pattern` at or after `pos` that its exclusion
    ///        does not reject
    static bool FindNextAccepted(const CompiledPattern& pattern, const std::string& text,
                                 size_t pos, RegexMatch* match);

    /// @brief Run every catalog pattern and collect candidate spans
    std::vector<Candidate> CollectCandidates(const std::string& text) const;

    /// @brief Redact high-entropy strings left in result->sanitized_text
    void ApplyEntropyPass(SanitizationResult* result, TokenCounters* counters) const;

    SanitizerConfig config_;
    std::vector<CompiledPattern> patterns_;
    std::unique_ptr<re2::RE2> token_regex_;
    std::unique_ptr<re2::RE2> entropy_candidate_regex_;
    bool initialized_ = false;
};

}  // namespace flowguard::guardian
