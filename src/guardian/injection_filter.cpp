/// @file injection_filter.cpp
/// @brief Prompt-injection filter implementation

#include "guardian/injection_filter.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"
#include "guardian/pattern_catalog.h"
#include "guardian/regex_matcher.h"

namespace flowguard::guardian {

namespace {

// Three high-severity matches saturate the score
const double kRiskNormalizer = 3.0;

}  // namespace

InjectionFilter::InjectionFilter(InjectionFilterConfig config)
    : config_(std::move(config)) {}

InjectionFilter::~InjectionFilter() = default;

absl::Status InjectionFilter::Initialize() {
    if (initialized_) {
        return absl::OkStatus();
    }

    std::vector<CompiledPattern> compiled;
    for (const auto& pattern : InjectionPatterns()) {
        if (!IsSeverityAllowed(config_.sensitivity, pattern.severity)) {
            continue;
        }
        auto regex = CompileExpression(pattern.expression, true);
        if (!regex.ok()) {
            return Annotate(regex.status(), InjectionTypeToString(pattern.type));
        }
        compiled.push_back({std::move(*regex), pattern.type, pattern.severity});
    }

    patterns_ = std::move(compiled);
    initialized_ = true;

    FLOWGUARD_LOG_DEBUG("Injection filter initialized: sensitivity={}, {} patterns",
                        SensitivityToString(config_.sensitivity), patterns_.size());
    return absl::OkStatus();
}

absl::StatusOr<InjectionResult> InjectionFilter::Scan(const std::string& text) const {
    if (!initialized_) {
        return absl::FailedPreconditionError("Injection filter not initialized");
    }

    const std::vector<std::string> lines = absl::StrSplit(text, '\n');

    InjectionResult result;
    for (const auto& pattern : patterns_) {
        for (size_t index = 0; index < lines.size(); ++index) {
            const std::string& line = lines[index];
            RegexMatch found;
            for (size_t pos = 0; FindNext(*pattern.regex, line, pos, &found);
                 pos = ResumeAfter(found)) {
                if (found.end == found.start) {
                    continue;
                }
                InjectionMatch match;
                match.injection_type = pattern.type;
                match.matched_text = line.substr(found.start, found.end - found.start);
                match.line_number = index + 1;
                match.severity = pattern.severity;
                match.description = InjectionDescription(pattern.type);
                result.matches.push_back(std::move(match));
            }
        }
    }

    result.is_safe = result.matches.empty();
    result.risk_score = CalculateRiskScore(result.matches);

    if (!result.is_safe) {
        FLOWGUARD_LOG_DEBUG("Injection scan: {} matches over {} lines, risk {:.2f}",
                            result.matches.size(), lines.size(), result.risk_score);
    }
    return result;
}

bool InjectionFilter::QuickCheck(const std::string& text) const {
    if (!initialized_) {
        return false;
    }
    for (absl::string_view line : absl::StrSplit(text, '\n')) {
        for (const auto& pattern : patterns_) {
            if (ContainsMatch(*pattern.regex, std::string_view(line.data(), line.size()))) {
                return false;
            }
        }
    }
    return true;
}

absl::StatusOr<std::vector<std::string>> InjectionFilter::GetSecurityFlags(
    const std::string& text) const {
    FLOWGUARD_ASSIGN_OR_RETURN(InjectionResult result, Scan(text));

    std::vector<std::string> flags;
    std::unordered_set<InjectionType> seen;
    for (const auto& match : result.matches) {
        if (!seen.insert(match.injection_type).second) {
            continue;
        }
        flags.push_back(absl::StrCat(
            "⚠️ ", absl::AsciiStrToUpper(SeverityToString(match.severity)), ": ",
            match.description, " (line ", match.line_number, ")"));
    }
    return flags;
}

double InjectionFilter::CalculateRiskScore(const std::vector<InjectionMatch>& matches) {
    double total = 0.0;
    for (const auto& match : matches) {
        total += SeverityWeight(match.severity);
    }
    return std::min(1.0, total / kRiskNormalizer);
}

}  // namespace flowguard::guardian
