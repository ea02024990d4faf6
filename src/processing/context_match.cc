#include "context_match.hpp"

#include <cctype>
#include <string>

using namespace patchy;

namespace {

bool
is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Try the enabled tiers at one position.
ContextMatch
match_at(gsl::span<const std::string> lines,
         gsl::span<const std::string> context,
         std::size_t position,
         const MatchOptions& options) {
    const MatchTier tiers[] = {MatchTier::Exact, MatchTier::Trimmed, MatchTier::Collapsed};

    for (const auto tier : tiers) {
        if (tier == MatchTier::Collapsed && !options.collapse_whitespace) {
            continue;
        }

        bool matched = true;
        for (std::size_t j = 0; j < context.size(); j++) {
            if (!lines_match(lines[position + j], context[j], tier)) {
                matched = false;
                break;
            }
        }

        if (matched) {
            return {static_cast<int64_t>(position), fuzz_for(tier)};
        }
    }

    return {};
}

}  // namespace

int64_t
patchy::fuzz_for(MatchTier tier) {
    switch (tier) {
        case MatchTier::Exact:
            return kFuzzExact;
        case MatchTier::Trimmed:
            return kFuzzTrimmed;
        case MatchTier::Collapsed:
            return kFuzzCollapsed;
    }
    return kFuzzNotFound;
}

std::string
patchy::trim_whitespace(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_space(s[begin])) {
        begin++;
    }
    while (end > begin && is_space(s[end - 1])) {
        end--;
    }
    return s.substr(begin, end - begin);
}

std::string
patchy::collapse_whitespace(const std::string& s) {
    std::string trimmed = trim_whitespace(s);
    std::string result;
    result.reserve(trimmed.size());

    bool in_space = false;
    for (char c : trimmed) {
        if (is_space(c)) {
            if (!in_space) {
                result.push_back(' ');
            }
            in_space = true;
        } else {
            result.push_back(c);
            in_space = false;
        }
    }
    return result;
}

bool
patchy::lines_match(const std::string& actual, const std::string& expected, MatchTier tier) {
    switch (tier) {
        case MatchTier::Exact:
            return actual == expected;
        case MatchTier::Trimmed:
            return trim_whitespace(actual) == trim_whitespace(expected);
        case MatchTier::Collapsed:
            return collapse_whitespace(actual) == collapse_whitespace(expected);
    }
    return false;
}

ContextMatch
patchy::find_context_core(gsl::span<const std::string> lines,
                          gsl::span<const std::string> context,
                          int64_t start,
                          const MatchOptions& options) {
    const auto line_count = static_cast<int64_t>(lines.size());
    const auto context_count = static_cast<int64_t>(context.size());

    if (start < 0 || start > line_count) {
        return {};
    }

    if (context.empty()) {
        return {start, kFuzzExact};
    }

    for (int64_t i = start; i + context_count <= line_count; i++) {
        auto match = match_at(lines, context, static_cast<std::size_t>(i), options);
        if (match.found()) {
            return match;
        }
    }

    return {};
}

ContextMatch
patchy::find_context(gsl::span<const std::string> lines,
                     gsl::span<const std::string> context,
                     int64_t start,
                     bool eof,
                     const MatchOptions& options) {
    // Without context the end of file marker is the only placement.
    if (eof && context.empty()) {
        ContextMatch match;
        match.index = static_cast<int64_t>(lines.size());
        match.fuzz = kFuzzExact;
        return match;
    }

    auto match = find_context_core(lines, context, start, options);
    if (match.found() || !eof || !options.eof_fallback) {
        return match;
    }

    const auto tail = static_cast<int64_t>(lines.size()) - static_cast<int64_t>(context.size());
    if (tail < 0) {
        return {};
    }

    return match_at(lines, context, static_cast<std::size_t>(tail), options);
}
