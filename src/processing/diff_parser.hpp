#pragma once

/*
    Line oriented reader for context anchored diffs.

    A diff is a list of hunks. Each hunk starts with a '@@' marker that may
    carry a free form hint, followed by directive lines:

        @@ def main():
         context line
        -deleted line
        +inserted line
         context line
        *** End of File

    There are no line numbers. Hunks are located by matching their context
    against the text being patched (see context_match.hpp).
*/

#include "processing/patch_result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

const std::string kHunkMarker = "@@";
const std::string kEndOfFileMarker = "*** End of File";
const std::string kEndPatchMarker = "*** End Patch";

// Prefixes that end a section. Envelope headers of multi file patches are
// included so a section never swallows the next file's header.
const std::vector<std::string> kSectionTerminators = {
    kHunkMarker,
    kEndOfFileMarker,
    kEndPatchMarker,
    "*** Update File:",
    "*** Add File:",
    "*** Delete File:",
    "*** Move to:",
};

const std::vector<std::string> kPatchTerminators = {kEndPatchMarker};

enum class DirectiveKind {
    Context,
    Deletion,
    Insertion,
};

struct Directive {
    DirectiveKind kind;
    std::string text;  // Line without the prefix character
};

// Classify a diff line by its first character. An empty line is taken as
// an empty context line.
bool
classify_directive(const std::string& line, Directive& directive);

struct ParserState {
    std::vector<std::string> lines;
    std::size_t index = 0;
    int64_t fuzz = 0;
};

// True when the cursor is past the last line, or when the current line
// starts with one of the terminators.
bool
is_done(const ParserState& state, const std::vector<std::string>& terminators);

// If the current line starts with 'prefix', store the rest of the line in
// 'remainder' and advance. Otherwise the cursor is left as is.
bool
read_str(ParserState& state, const std::string& prefix, std::string& remainder);

struct Section {
    std::vector<std::string> leading_context;
    std::vector<std::string> delete_lines;
    std::vector<std::string> insert_lines;
    std::vector<std::string> trailing_context;

    // The section was closed by an explicit end of file marker.
    bool eof = false;

    // More edits follow in the same hunk; parsing resumes at the trailing
    // context, which then leads the next section.
    bool continued = false;

    std::size_t end_index = 0;

    // The lines the section expects to find in the text, in order.
    std::vector<std::string>
    expected_lines() const;

    bool
    has_edits() const {
        return !delete_lines.empty() || !insert_lines.empty();
    }
};

bool
read_section(const std::vector<std::string>& lines,
             std::size_t start_index,
             Section& section,
             PatchResult& result);

}  // namespace patchy
