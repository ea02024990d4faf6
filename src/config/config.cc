#include "config.hpp"

#include <util/config_reader/config_reader.hpp>
#include <util/lines.hpp>

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

static std::string config_doc_general = R"foo(# General configuration for ´patchy´
#
# Configure default options. These can be overriden with command-line arguments.
#
# [matching]
#   collapse_whitespace  also accept context whose inner whitespace differs
#   eof_fallback         let end-of-file hunks anchor at the end of the text
#   max_fuzz             reject patches needing more tolerance; -1 disables
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, patchy::ConfigTable& config_table, patchy::ParseResult& load_result) {
    if (patchy::cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == patchy::ParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_path, const patchy::ConfigTable& config) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "Failed to create '{}': {}\n", config_root, ec.message());
        return;
    }

    if (!patchy::write_file(config_path, patchy::cfg_serialize(config))) {
        fmt::print(stderr, "warning: default settings were not saved\n");
    }
}

void
patchy::config_apply_options(patchy::ConfigTable& config, patchy::ProgramOptions& program_options) {
    using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

    // clang-format off
    const OptionVector options = {
        { "general.verbose",              ConfigVariableType::Bool, &program_options.verbose },
        { "matching.collapse_whitespace", ConfigVariableType::Bool, &program_options.match.collapse_whitespace },
        { "matching.eof_fallback",        ConfigVariableType::Bool, &program_options.match.eof_fallback },
        { "matching.max_fuzz",            ConfigVariableType::Int,  &program_options.max_fuzz },
    };
    // clang-format on

    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            auto& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *((bool*) ptr) = value.as_bool();
                    } else {
                        fmt::print(stderr, "warning: '{}' should be true or false, got {}\n", path, repr(value));
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (value.is_int()) {
                        *((int64_t*) ptr) = value.as_int();
                    } else {
                        fmt::print(stderr, "warning: '{}' should be an integer, got {}\n", path, repr(value));
                    }
                } break;
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, Value{Value::Bool{*(bool*) ptr}});
                } break;
                case ConfigVariableType::Int: {
                    config.set_value_at(path, Value{Value::Int{*(int64_t*) ptr}});
                } break;
            }
        }
    }
}

void
patchy::config_apply_options(patchy::ProgramOptions& program_options) {
    const std::string config_file_name = "patchy.conf";
    const std::string config_root = patchy::config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    ConfigTable config_table;
    switch (config_load_file(config_path, config_table, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            // Keep the defaults, and leave the broken file alone.
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            return;
        }
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    };

    config_apply_options(config_table, program_options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_table.header_comment = config_doc_general;
        config_save(config_root, config_path, config_table);
    }
}
