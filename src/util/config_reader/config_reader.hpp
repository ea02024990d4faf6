#pragma once

/**

 Configuration file reader

 An INI-like configuration format:

    # comment
    [section]
        key = value

 Values are booleans (true/false), integers, or strings. Strings may be
 quoted with ' or ". Keys are addressed by dotted path, "section.key".

*/

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace patchy {

struct Value {
    using Int = int64_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Bool, Int, String> v;

    // clang-format off
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Bool& as_bool() { return std::get<Value::Bool>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

struct ConfigTable {
    // Keyed by dotted path
    std::map<std::string, Value> values;

    // Emitted at the top of the file when serializing
    std::string header_comment;

    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    void
    set_value_at(std::string_view dotted_path, Value value);
};

// clang-format off
enum class ParseErrorKind {
    None,
    File,
    Parsing,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;
    std::size_t line = 0;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(ParseErrorKind error_kind, std::size_t line_number, const std::string& error_message);
};

bool
cfg_parse(const std::string& input_data, ParseResult& result, ConfigTable& table);

bool
cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table);

std::string
cfg_serialize(const ConfigTable& table);

std::string
repr(const Value& value);

}  // namespace patchy
