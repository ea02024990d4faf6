#include "config_reader.hpp"

#include "util/lines.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace patchy;

namespace internal {

std::string_view
trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Drop a trailing '#' comment, ignoring '#' inside quotes.
std::string_view
strip_comment(std::string_view s) {
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return s.substr(0, i);
        }
    }
    return s;
}

bool
is_integer(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) {
        return false;
    }
    for (; i < s.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

bool
parse_value(std::string_view text, Value& value, std::string& error) {
    if (text.empty()) {
        error = "missing value";
        return false;
    }

    char first = text.front();
    if (first == '\'' || first == '"') {
        if (text.size() < 2 || text.back() != first) {
            error = "unterminated string";
            return false;
        }
        value.v = Value::String{text.substr(1, text.size() - 2)};
        return true;
    }

    if (text == "true" || text == "false") {
        value.v = Value::Bool{text == "true"};
        return true;
    }

    if (is_integer(text)) {
        value.v = Value::Int{std::strtoll(std::string(text).c_str(), nullptr, 10)};
        return true;
    }

    value.v = Value::String{text};
    return true;
}

std::tuple<std::string_view, std::string_view>
split_section(std::string_view dotted_path) {
    auto pos = dotted_path.find('.');
    if (pos == std::string_view::npos) {
        return std::make_tuple(std::string_view{}, dotted_path);
    }
    return std::make_tuple(dotted_path.substr(0, pos), dotted_path.substr(pos + 1));
}

}  // namespace internal

void
patchy::ParseResult::set_error(ParseErrorKind error_kind, std::size_t line_number, const std::string& error_message) {
    kind = error_kind;
    line = line_number;
    error = line_number > 0 ? fmt::format("line {}: {}", line_number, error_message) : error_message;
}

std::optional<std::reference_wrapper<Value>>
patchy::ConfigTable::lookup_value_by_path(std::string_view dotted_path) {
    auto it = values.find(std::string(dotted_path));
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void
patchy::ConfigTable::set_value_at(std::string_view dotted_path, Value value) {
    values[std::string(dotted_path)] = std::move(value);
}

bool
patchy::cfg_parse(const std::string& input_data, ParseResult& result, ConfigTable& table) {
    std::string section;

    const auto lines = split_lines(input_data);
    for (std::size_t i = 0; i < lines.size(); i++) {
        const std::size_t line_number = i + 1;
        auto text = internal::trim(internal::strip_comment(lines[i]));

        if (text.empty()) {
            continue;
        }

        if (text.front() == '[') {
            if (text.back() != ']') {
                result.set_error(ParseErrorKind::Parsing, line_number, "expected ']' after section name");
                return false;
            }
            auto name = internal::trim(text.substr(1, text.size() - 2));
            if (name.empty()) {
                result.set_error(ParseErrorKind::Parsing, line_number, "empty section name");
                return false;
            }
            section = std::string(name);
            continue;
        }

        auto assign = text.find('=');
        if (assign == std::string_view::npos) {
            result.set_error(ParseErrorKind::Parsing, line_number,
                             fmt::format("expected 'key = value', got '{}'", text));
            return false;
        }

        auto key = internal::trim(text.substr(0, assign));
        if (key.empty()) {
            result.set_error(ParseErrorKind::Parsing, line_number, "missing key");
            return false;
        }

        Value value;
        std::string error;
        if (!internal::parse_value(internal::trim(text.substr(assign + 1)), value, error)) {
            result.set_error(ParseErrorKind::Parsing, line_number, fmt::format("{} for key '{}'", error, key));
            return false;
        }

        auto path = section.empty() ? std::string(key) : fmt::format("{}.{}", section, key);
        table.set_value_at(path, std::move(value));
    }

    result.kind = ParseErrorKind::None;
    return true;
}

bool
patchy::cfg_load_file(const std::string& file_path, ParseResult& result, ConfigTable& table) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        result.set_error(ParseErrorKind::File, 0, fmt::format("file does not exist: {}", file_path));
        return false;
    }

    std::string contents;
    if (!read_file(file_path, contents)) {
        result.set_error(ParseErrorKind::File, 0, fmt::format("could not read: {}", file_path));
        return false;
    }

    return cfg_parse(contents, result, table);
}

std::string
patchy::repr(const Value& value) {
    if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    }
    return fmt::format("'{}'", value.as_string());
}

std::string
patchy::cfg_serialize(const ConfigTable& table) {
    std::string s;

    if (!table.header_comment.empty()) {
        s += table.header_comment;
        if (s.back() != '\n') {
            s += "\n";
        }
    }

    // Keys outside any section must come before the first header.
    for (const auto& [path, value] : table.values) {
        auto [section, key] = internal::split_section(path);
        if (section.empty()) {
            s += fmt::format("{} = {}\n", key, repr(value));
        }
    }

    std::string current_section;
    for (const auto& [path, value] : table.values) {
        auto [section, key] = internal::split_section(path);
        if (section.empty()) {
            continue;
        }
        if (section != current_section) {
            if (!s.empty()) {
                s += "\n";
            }
            s += fmt::format("[{}]\n", section);
            current_section = std::string(section);
        }
        s += fmt::format("    {} = {}\n", key, repr(value));
    }

    return s;
}
