#include "util/config_reader/config_reader.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

TEST_CASE("config_reader") {
    ParseResult result;
    ConfigTable table;

    SUBCASE("values") {
        std::string input = R"foo(# patchy
top = 1

[general]
    verbose = true   # trailing comment
    name = 'with # hash'
    bare = plain text

[matching]
    max_fuzz = -1
)foo";
        REQUIRE(cfg_parse(input, result, table));
        REQUIRE(result.is_ok());

        REQUIRE(table.lookup_value_by_path("top")->get().as_int() == 1);
        REQUIRE(table.lookup_value_by_path("general.verbose")->get().as_bool() == true);
        REQUIRE(table.lookup_value_by_path("general.name")->get().as_string() == "with # hash");
        REQUIRE(table.lookup_value_by_path("general.bare")->get().as_string() == "plain text");
        REQUIRE(table.lookup_value_by_path("matching.max_fuzz")->get().as_int() == -1);
        REQUIRE_FALSE(table.lookup_value_by_path("matching.missing"));
    }

    SUBCASE("missing_assignment") {
        REQUIRE_FALSE(cfg_parse("[general]\nverbose\n", result, table));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.line == 2);
    }

    SUBCASE("unterminated_section") {
        REQUIRE_FALSE(cfg_parse("[general\n", result, table));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.line == 1);
    }

    SUBCASE("unterminated_string") {
        REQUIRE_FALSE(cfg_parse("key = 'abc\n", result, table));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
    }

    SUBCASE("missing_file") {
        REQUIRE_FALSE(cfg_load_file("/nonexistent/patchy/patchy.conf", result, table));
        REQUIRE(result.kind == ParseErrorKind::File);
    }

    SUBCASE("serialize") {
        table.header_comment = "# header\n";
        table.set_value_at("matching.eof_fallback", Value{Value::Bool{true}});
        table.set_value_at("general.verbose", Value{Value::Bool{false}});
        table.set_value_at("general.label", Value{Value::String{"x y"}});
        table.set_value_at("matching.max_fuzz", Value{Value::Int{-1}});

        std::string expected = R"foo(# header

[general]
    label = 'x y'
    verbose = false

[matching]
    eof_fallback = true
    max_fuzz = -1
)foo";
        REQUIRE(cfg_serialize(table) == expected);

        ConfigTable reloaded;
        REQUIRE(cfg_parse(cfg_serialize(table), result, reloaded));
        REQUIRE(reloaded.lookup_value_by_path("general.label")->get().as_string() == "x y");
        REQUIRE(reloaded.lookup_value_by_path("matching.max_fuzz")->get().as_int() == -1);
    }
}
