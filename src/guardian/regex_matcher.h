#pragma once

/// @file regex_matcher.h
/// @brief RE2 compilation and match iteration shared by the guardian engines
///
/// RE2 matches in time linear in the input and never recurses per input
/// byte, so a single very long line (minified bundle, embedded blob) is
/// scanned like any other.

#include <cstddef>
#include <memory>
#include <string_view>

#include <absl/status/statusor.h>
#include <re2/re2.h>

namespace flowguard::guardian {

/// Largest counted repetition RE2 accepts in `{n,m}`
const int kMaxRepetition = 1000;

/// @brief Offsets of one match within the searched text
struct RegexMatch {
    size_t start = 0;
    size_t end = 0;

    /// First capture group when it took part in the match, else the whole match
    size_t value_start = 0;
    size_t value_end = 0;
};

/// @brief Compile an expression with byte (Latin-1) semantics
/// @return Internal error carrying RE2's message if the expression is invalid
absl::StatusOr<std::unique_ptr<re2::RE2>> CompileExpression(std::string_view expression,
                                                            bool case_insensitive);

/// @brief Leftmost-first match of `regex` starting at or after `pos`
///
/// Text before `pos` still counts as context for `\b` and `^`.
bool FindNext(const re2::RE2& regex, std::string_view text, size_t pos, RegexMatch* match);

/// @brief Search position following `match`; steps past empty matches
inline size_t ResumeAfter(const RegexMatch& match) {
    return match.end > match.start ? match.end : match.start + 1;
}

/// @brief True if `regex` matches `text` exactly at `pos`
bool MatchesAt(const re2::RE2& regex, std::string_view text, size_t pos);

/// @brief True if `regex` matches anywhere in `text`
bool ContainsMatch(const re2::RE2& regex, std::string_view text);

}  // namespace flowguard::guardian
