#pragma once

/*
    Apply a context anchored diff to a text.

    Update mode parses the diff into sections, locates each section in the
    original text by fuzzy context matching, and splices the edits in.
    Create mode builds a new text from '+' lines only and never looks at
    the original.

    Either the whole diff applies, or nothing does: on failure the output
    string is left untouched and 'result' says why.
*/

#include "processing/context_match.hpp"
#include "processing/patch_result.hpp"

#include <string>
#include <vector>

namespace patchy {

enum class PatchMode {
    Update,
    Create,
};

bool
patch_mode_from_string(const std::string& s, PatchMode& mode);

std::string
repr(PatchMode mode);

bool
apply_diff(const std::string& original,
           const std::string& diff,
           PatchMode mode,
           std::string& out_text,
           PatchResult& result,
           const MatchOptions& options = {});

bool
apply_diff(const std::string& original, const std::string& diff, std::string& out_text, PatchResult& result);

// Create mode on already split diff lines.
bool
parse_create_diff(const std::vector<std::string>& diff_lines,
                  std::vector<std::string>& out_lines,
                  PatchResult& result);

}  // namespace patchy
