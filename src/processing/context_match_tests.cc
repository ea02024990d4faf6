#include "processing/context_match.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

using Lines = std::vector<std::string>;

TEST_CASE("whitespace_normalization") {
    REQUIRE(trim_whitespace("  a b \t") == "a b");
    REQUIRE(trim_whitespace(" \t ") == "");
    REQUIRE(collapse_whitespace("  a \t  b  c ") == "a b c");
    REQUIRE(lines_match("a", "a", MatchTier::Exact));
    REQUIRE_FALSE(lines_match(" a", "a", MatchTier::Exact));
    REQUIRE(lines_match(" a ", "a", MatchTier::Trimmed));
    REQUIRE_FALSE(lines_match("a  b", "a b", MatchTier::Trimmed));
    REQUIRE(lines_match("a  b", "a b", MatchTier::Collapsed));
}

TEST_CASE("find_context_core") {
    SUBCASE("exact") {
        Lines lines = {"a", "b", "c"};
        Lines context = {"b", "c"};
        auto match = find_context_core(lines, context, 0);
        REQUIRE(match.index == 1);
        REQUIRE(match.fuzz == kFuzzExact);
    }

    SUBCASE("stripped_matches") {
        Lines lines = {" line "};
        Lines context = {"line"};
        auto match = find_context_core(lines, context, 0);
        REQUIRE(match.index == 0);
        REQUIRE(match.fuzz == kFuzzTrimmed);
    }

    SUBCASE("whitespace_drift_is_positive_and_bounded") {
        Lines lines = {"int main() {", "\treturn 0;  ", "}"};
        Lines context = {"int main() {", "    return 0;", "}"};
        auto match = find_context_core(lines, context, 0);
        REQUIRE(match.found());
        REQUIRE(match.fuzz > 0);
        REQUIRE(match.fuzz < kFuzzNotFound);
    }

    SUBCASE("first_acceptable_position_wins") {
        // The exact copy further down is not preferred over the earlier
        // whitespace drifted one.
        Lines lines = {"  target", "x", "target"};
        Lines context = {"target"};
        auto match = find_context_core(lines, context, 0);
        REQUIRE(match.index == 0);
        REQUIRE(match.fuzz == kFuzzTrimmed);
    }

    SUBCASE("respects_start") {
        Lines lines = {"a", "b", "a"};
        Lines context = {"a"};
        auto match = find_context_core(lines, context, 1);
        REQUIRE(match.index == 2);
    }

    SUBCASE("empty_context_matches_at_start") {
        Lines lines = {"a", "b"};
        Lines context;
        auto match = find_context_core(lines, context, 2);
        REQUIRE(match.index == 2);
        REQUIRE(match.fuzz == kFuzzExact);
    }

    SUBCASE("not_found") {
        Lines lines = {"a", "b"};
        Lines context = {"z"};
        auto match = find_context_core(lines, context, 0);
        REQUIRE_FALSE(match.found());
        REQUIRE(match.index == kNotFound);
        REQUIRE(match.fuzz >= 10000);
    }

    SUBCASE("collapse_tier_is_opt_in") {
        Lines lines = {"if (a  &&   b)"};
        Lines context = {"if (a && b)"};
        REQUIRE_FALSE(find_context_core(lines, context, 0).found());

        MatchOptions options;
        options.collapse_whitespace = true;
        auto match = find_context_core(lines, context, 0, options);
        REQUIRE(match.index == 0);
        REQUIRE(match.fuzz == kFuzzCollapsed);
    }
}

TEST_CASE("find_context") {
    SUBCASE("eof_fallbacks") {
        Lines lines = {"one"};
        Lines context = {"missing"};
        auto match = find_context(lines, context, 0, true);
        REQUIRE(match.index == -1);
        REQUIRE(match.fuzz >= 10000);
    }

    SUBCASE("eof_anchors_to_tail") {
        // The cursor has moved past the start of the tail window, so a
        // forward search cannot see it.
        Lines lines = {"a", "b", "c"};
        Lines context = {"b", "c"};

        auto anchored = find_context(lines, context, 2, true);
        REQUIRE(anchored.index == 1);
        REQUIRE(anchored.fuzz == kFuzzExact);

        auto forward_only = find_context(lines, context, 2, false);
        REQUIRE_FALSE(forward_only.found());

        MatchOptions options;
        options.eof_fallback = false;
        auto disabled = find_context(lines, context, 2, true, options);
        REQUIRE_FALSE(disabled.found());
        REQUIRE(disabled.fuzz >= kFuzzNotFound);
    }

    SUBCASE("forward_match_preferred_over_tail") {
        Lines lines = {"x", "y", "x"};
        Lines context = {"x"};
        auto match = find_context(lines, context, 0, true);
        REQUIRE(match.index == 0);
    }

    SUBCASE("eof_without_context_matches_at_end") {
        Lines lines = {"a", "b"};
        Lines context;
        auto match = find_context(lines, context, 0, true);
        REQUIRE(match.index == 2);
        REQUIRE(match.fuzz == kFuzzExact);

        REQUIRE(find_context(lines, context, 0, false).index == 0);
    }

    SUBCASE("context_longer_than_text") {
        Lines lines = {"a"};
        Lines context = {"a", "b"};
        REQUIRE_FALSE(find_context(lines, context, 0, true).found());
    }
}
