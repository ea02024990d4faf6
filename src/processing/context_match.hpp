#pragma once

/*
    Locate a run of expected lines inside a text.

    Matching is tiered. At every candidate position the tiers are tried from
    strictest to loosest, and the first position where any tier matches is
    the answer. A later position is never preferred for having a cheaper
    tier, so on ambiguous input the earliest plausible placement wins.

        tier        comparison                          fuzz
        exact       byte for byte                          0
        trimmed     leading/trailing whitespace ignored  100
        collapsed   trimmed, inner whitespace runs      1000
                    compared as a single space
                    (opt-in)
*/

#include <gsl/span>

#include <cstdint>
#include <string>

namespace patchy {

const int64_t kNotFound = -1;

const int64_t kFuzzExact = 0;
const int64_t kFuzzTrimmed = 100;
const int64_t kFuzzCollapsed = 1000;
const int64_t kFuzzNotFound = 10000;

enum class MatchTier {
    Exact,
    Trimmed,
    Collapsed,
};

struct MatchOptions {
    bool collapse_whitespace = false;

    // Allow end of file hunks to anchor against the tail of the text.
    bool eof_fallback = true;
};

struct ContextMatch {
    int64_t index = kNotFound;
    int64_t fuzz = kFuzzNotFound;

    bool
    found() const {
        return index != kNotFound;
    }
};

int64_t
fuzz_for(MatchTier tier);

std::string
trim_whitespace(const std::string& s);

std::string
collapse_whitespace(const std::string& s);

bool
lines_match(const std::string& actual, const std::string& expected, MatchTier tier);

// Forward search from 'start'.
ContextMatch
find_context_core(gsl::span<const std::string> lines,
                  gsl::span<const std::string> context,
                  int64_t start,
                  const MatchOptions& options = {});

// Forward search, and for end of file hunks a last attempt anchored at the
// tail of the text. An end of file hunk without context matches at the end.
ContextMatch
find_context(gsl::span<const std::string> lines,
             gsl::span<const std::string> context,
             int64_t start,
             bool eof,
             const MatchOptions& options = {});

}  // namespace patchy
