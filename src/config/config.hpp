#pragma once

#include "processing/apply_diff.hpp"
#include "processing/context_match.hpp"
#include "util/config_reader/config_reader.hpp"

#include <cstdint>
#include <string>

namespace patchy {

struct ProgramOptions {
    bool help = false;
    bool verbose = false;
    bool in_place = false;

    PatchMode mode = PatchMode::Update;
    MatchOptions match;

    // Reject patches whose accumulated fuzz is above this; -1 disables.
    int64_t max_fuzz = -1;

    std::string target_file;
    std::string diff_file;
    std::string output_file;
};

std::string
config_get_directory();

// Load the config file and apply its settings to 'program_options'. A
// missing file is created with the current defaults.
void
config_apply_options(patchy::ProgramOptions& program_options);

// Apply the settings of an already loaded table. Settings missing from the
// table are filled in from 'program_options'.
void
config_apply_options(patchy::ConfigTable& config, patchy::ProgramOptions& program_options);

}  // namespace patchy
