/// @file regex_matcher.cpp
/// @brief RE2 helpers

#include "guardian/regex_matcher.h"

#include <algorithm>
#include <array>

#include "common/error.h"

namespace flowguard::guardian {

namespace {

re2::StringPiece ToPiece(std::string_view text) {
    return re2::StringPiece(text.data(), text.size());
}

}  // namespace

absl::StatusOr<std::unique_ptr<re2::RE2>> CompileExpression(std::string_view expression,
                                                            bool case_insensitive) {
    re2::RE2::Options options;
    options.set_encoding(re2::RE2::Options::EncodingLatin1);
    options.set_case_sensitive(!case_insensitive);
    options.set_log_errors(false);

    auto regex = std::make_unique<re2::RE2>(ToPiece(expression), options);
    if (!regex->ok()) {
        return PatternCompileError(absl::StrCat(
            "Invalid expression '", absl::string_view(expression.data(), expression.size()), "': ", regex->error()));
    }
    return regex;
}

bool FindNext(const re2::RE2& regex, std::string_view text, size_t pos, RegexMatch* match) {
    if (pos > text.size()) {
        return false;
    }

    const re2::StringPiece input = ToPiece(text);
    std::array<re2::StringPiece, 2> groups;
    const int count = std::min(regex.NumberOfCapturingGroups(), 1) + 1;
    if (!regex.Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), count)) {
        return false;
    }

    match->start = static_cast<size_t>(groups[0].data() - input.data());
    match->end = match->start + groups[0].size();
    if (count > 1 && groups[1].data() != nullptr) {
        match->value_start = static_cast<size_t>(groups[1].data() - input.data());
        match->value_end = match->value_start + groups[1].size();
    } else {
        match->value_start = match->start;
        match->value_end = match->end;
    }
    return true;
}

bool MatchesAt(const re2::RE2& regex, std::string_view text, size_t pos) {
    if (pos > text.size()) {
        return false;
    }
    return regex.Match(ToPiece(text), pos, text.size(), re2::RE2::ANCHOR_START, nullptr, 0);
}

bool ContainsMatch(const re2::RE2& regex, std::string_view text) {
    return regex.Match(ToPiece(text), 0, text.size(), re2::RE2::UNANCHORED, nullptr, 0);
}

}  // namespace flowguard::guardian
