#include "util/lines.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

TEST_CASE("split_lines") {
    SUBCASE("empty") {
        REQUIRE(split_lines("").empty());
    }

    SUBCASE("trailing_newline_is_dropped") {
        auto lines = split_lines("a\nb\n");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0] == "a");
        REQUIRE(lines[1] == "b");
    }

    SUBCASE("no_trailing_newline") {
        auto lines = split_lines("a\nb");
        REQUIRE(lines == std::vector<std::string>{"a", "b"});
    }

    SUBCASE("only_one_newline_is_dropped") {
        auto lines = split_lines("a\n\n");
        REQUIRE(lines == std::vector<std::string>{"a", ""});
    }

    SUBCASE("lone_newline") {
        auto lines = split_lines("\n");
        REQUIRE(lines == std::vector<std::string>{""});
    }

    SUBCASE("blank_lines_in_the_middle") {
        auto lines = split_lines("a\n\n\nb");
        REQUIRE(lines == std::vector<std::string>{"a", "", "", "b"});
    }
}

TEST_CASE("join_lines") {
    SUBCASE("empty") {
        std::vector<std::string> lines;
        REQUIRE(join_lines(lines) == "");
    }

    SUBCASE("appends_newline") {
        std::vector<std::string> lines = {"hello", "world"};
        REQUIRE(join_lines(lines) == "hello\nworld\n");
    }

    SUBCASE("explicit_empty_last_line") {
        std::vector<std::string> lines = {"hello", "world", ""};
        REQUIRE(join_lines(lines) == "hello\nworld\n");
    }

    SUBCASE("trailing_blank_line_is_lost") {
        REQUIRE(join_lines(split_lines("a\nb\n\n")) == "a\nb\n");
    }

    SUBCASE("single_empty_line") {
        std::vector<std::string> lines = {""};
        REQUIRE(join_lines(lines) == "\n");
    }
}

TEST_CASE("normalization_is_idempotent") {
    const std::vector<std::string> inputs = {
        "", "a", "a\n", "a\nb", "a\nb\n", "\n", "  x\n\ty", "a\n\nb\n",
    };

    for (const auto& input : inputs) {
        CAPTURE(input);
        auto lines = split_lines(input);
        auto again = split_lines(join_lines(lines));
        REQUIRE(lines == again);
    }
}
