/// @file sanitizer.cpp
/// @brief Secret and PII sanitizer implementation

#include "guardian/sanitizer.h"

#include <algorithm>
#include <array>
#include <cmath>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"
#include "guardian/pattern_catalog.h"

namespace flowguard::guardian {

namespace {

bool InsideAny(size_t start, size_t end, const std::vector<std::pair<size_t, size_t>>& spans) {
    for (const auto& [span_start, span_end] : spans) {
        if (start >= span_start && end <= span_end) {
            return true;
        }
    }
    return false;
}

bool OverlapsAny(size_t start, size_t end, const std::vector<std::pair<size_t, size_t>>& spans) {
    for (const auto& [span_start, span_end] : spans) {
        if (start < span_end && span_start < end) {
            return true;
        }
    }
    return false;
}

size_t LineNumberAt(const std::string& text, size_t offset) {
    return static_cast<size_t>(
        std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n')) + 1;
}

}  // namespace

Sanitizer::Sanitizer(SanitizerConfig config)
    : config_(std::move(config)) {}

Sanitizer::~Sanitizer() = default;

absl::Status Sanitizer::Initialize() {
    if (initialized_) {
        return absl::OkStatus();
    }

    std::vector<CompiledPattern> compiled;
    compiled.reserve(SensitivePatterns().size());

    for (const auto& pattern : SensitivePatterns()) {
        CompiledPattern entry;
        entry.type = pattern.type;

        auto regex = CompileExpression(pattern.expression, pattern.case_insensitive);
        if (!regex.ok()) {
            return Annotate(regex.status(), SensitiveTypeToString(pattern.type));
        }
        entry.regex = std::move(*regex);

        if (pattern.exclusion != nullptr) {
            auto exclusion = CompileExpression(pattern.exclusion, pattern.case_insensitive);
            if (!exclusion.ok()) {
                return Annotate(exclusion.status(), SensitiveTypeToString(pattern.type));
            }
            entry.exclusion = std::move(*exclusion);
        }
        compiled.push_back(std::move(entry));
    }

    FLOWGUARD_ASSIGN_OR_RETURN(token_regex_,
                               CompileExpression(kRedactionTokenExpression, false));
    FLOWGUARD_ASSIGN_OR_RETURN(
        entropy_candidate_regex_,
        CompileExpression(absl::StrCat(R"(\b[A-Za-z0-9_/+=-]{)", config_.min_secret_length,
                                       ",", config_.max_secret_length, R"(}\b)"),
                          false));

    patterns_ = std::move(compiled);
    initialized_ = true;

    FLOWGUARD_LOG_DEBUG("Sanitizer initialized with {} patterns (entropy pass {})",
                        patterns_.size(), config_.enable_high_entropy ? "on" : "off");
    return absl::OkStatus();
}

std::vector<Sanitizer::Span> Sanitizer::FindTokenSpans(const std::string& text) const {
    std::vector<Span> spans;
    RegexMatch match;
    for (size_t pos = 0; FindNext(*token_regex_, text, pos, &match); pos = ResumeAfter(match)) {
        spans.emplace_back(match.start, match.end);
    }
    return spans;
}

bool Sanitizer::FindNextAccepted(const CompiledPattern& pattern, const std::string& text,
                                 size_t pos, RegexMatch* match) {
    while (FindNext(*pattern.regex, text, pos, match)) {
        if (!pattern.exclusion || !MatchesAt(*pattern.exclusion, text, match->start)) {
            return true;
        }
        // Rejected start: later starts may still match
        pos = match->start + 1;
    }
    return false;
}

std::vector<Sanitizer::Candidate> Sanitizer::CollectCandidates(const std::string& text) const {
    const std::vector<Span> token_spans = FindTokenSpans(text);

    std::vector<Candidate> candidates;
    for (const auto& pattern : patterns_) {
        RegexMatch match;
        for (size_t pos = 0; FindNextAccepted(pattern, text, pos, &match);
             pos = ResumeAfter(match)) {
            // Redact only the value when a capture group isolates it
            if (match.value_end == match.value_start ||
                InsideAny(match.value_start, match.value_end, token_spans)) {
                continue;
            }
            candidates.push_back({match.value_start, match.value_end, pattern.type});
        }
    }
    return candidates;
}

absl::StatusOr<SanitizationResult> Sanitizer::Sanitize(const std::string& text) const {
    if (!initialized_) {
        return absl::FailedPreconditionError("Sanitizer not initialized");
    }

    SanitizationResult result;
    result.sanitized_text = text;

    std::vector<Candidate> candidates = CollectCandidates(text);

    // Earliest start wins; at equal starts the longer span, then catalog
    // order (stable sort keeps insertion order).
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         if (a.start != b.start) return a.start < b.start;
                         return a.end > b.end;
                     });

    std::vector<Candidate> kept;
    for (const auto& candidate : candidates) {
        if (kept.empty() || candidate.start >= kept.back().end) {
            kept.push_back(candidate);
        }
    }

    // Replace back to front so earlier offsets stay valid
    TokenCounters counters;
    for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
        const int sequence = ++counters[it->type];

        RedactedItem item;
        item.sensitive_type = it->type;
        item.original_length = it->end - it->start;
        item.line_number = LineNumberAt(text, it->start);
        item.token = MakeRedactionToken(it->type, sequence);

        result.sanitized_text.replace(it->start, item.original_length, item.token);

        if (IsSecretType(it->type)) {
            result.secrets_detected = true;
        } else {
            result.pii_detected = true;
        }
        result.redacted_items.push_back(std::move(item));
    }
    std::reverse(result.redacted_items.begin(), result.redacted_items.end());

    const size_t catalog_count = result.redacted_items.size();

    if (config_.enable_high_entropy) {
        ApplyEntropyPass(&result, &counters);
    }

    FLOWGUARD_LOG_DEBUG("Sanitized {} bytes: {} catalog redactions, {} entropy redactions",
                        text.size(), catalog_count,
                        result.redacted_items.size() - catalog_count);
    return result;
}

void Sanitizer::ApplyEntropyPass(SanitizationResult* result, TokenCounters* counters) const {
    // Lines of the catalog-sanitized text; replacements below edit the
    // whole text, not these copies.
    const std::vector<std::string> lines = absl::StrSplit(result->sanitized_text, '\n');

    for (size_t index = 0; index < lines.size(); ++index) {
        const std::string& line = lines[index];
        const std::vector<Span> token_spans = FindTokenSpans(line);

        std::vector<std::string> secrets;
        RegexMatch match;
        for (size_t pos = 0; FindNext(*entropy_candidate_regex_, line, pos, &match);
             pos = ResumeAfter(match)) {
            if (OverlapsAny(match.start, match.end, token_spans)) {
                continue;
            }
            std::string candidate = line.substr(match.start, match.end - match.start);
            if (CalculateEntropy(candidate) >= config_.entropy_threshold) {
                secrets.push_back(std::move(candidate));
            }
        }

        for (const auto& secret : secrets) {
            // First remaining occurrence only
            const size_t pos = result->sanitized_text.find(secret);
            if (pos == std::string::npos) {
                continue;
            }

            RedactedItem item;
            item.sensitive_type = SensitiveType::kSecret;
            item.original_length = secret.size();
            item.line_number = index + 1;
            item.token = MakeRedactionToken(SensitiveType::kSecret,
                                            ++(*counters)[SensitiveType::kSecret]);

            result->sanitized_text.replace(pos, secret.size(), item.token);
            result->secrets_detected = true;
            result->redacted_items.push_back(std::move(item));
        }
    }
}

bool Sanitizer::QuickCheck(const std::string& text) const {
    if (!initialized_) {
        return false;
    }
    RegexMatch match;
    for (const auto& pattern : patterns_) {
        if (FindNextAccepted(pattern, text, 0, &match)) {
            return false;
        }
    }
    return true;
}

double Sanitizer::CalculateEntropy(std::string_view data) {
    if (data.empty()) {
        return 0.0;
    }

    std::array<size_t, 256> counts{};
    for (unsigned char c : data) {
        counts[c]++;
    }

    double entropy = 0.0;
    const double length = static_cast<double>(data.size());
    for (size_t count : counts) {
        if (count > 0) {
            const double p = static_cast<double>(count) / length;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

}  // namespace flowguard::guardian
