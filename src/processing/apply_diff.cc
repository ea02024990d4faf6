#include "apply_diff.hpp"

#include "processing/chunk.hpp"
#include "processing/diff_parser.hpp"
#include "util/lines.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

using namespace patchy;

std::string
patchy::repr(PatchErrorKind kind) {
    switch (kind) {
        case PatchErrorKind::None:
            return "None";
        case PatchErrorKind::Format:
            return "Format";
        case PatchErrorKind::Resolution:
            return "Resolution";
    }
    return "Unknown";
}

bool
patchy::patch_mode_from_string(const std::string& s, PatchMode& mode) {
    if (s == "update" || s == "default") {
        mode = PatchMode::Update;
        return true;
    } else if (s == "create") {
        mode = PatchMode::Create;
        return true;
    }
    return false;
}

std::string
patchy::repr(PatchMode mode) {
    switch (mode) {
        case PatchMode::Update:
            return "update";
        case PatchMode::Create:
            return "create";
    }
    return "unknown";
}

bool
patchy::parse_create_diff(const std::vector<std::string>& diff_lines,
                          std::vector<std::string>& out_lines,
                          PatchResult& result) {
    const std::vector<std::string> terminators = {kEndPatchMarker, kEndOfFileMarker};

    ParserState parser{diff_lines};
    std::vector<std::string> output;

    while (!is_done(parser, terminators)) {
        const std::string& line = parser.lines[parser.index];
        parser.index++;

        if (trim_whitespace(line).empty() || line.compare(0, kHunkMarker.size(), kHunkMarker) == 0) {
            continue;
        }

        Directive directive;
        if (!classify_directive(line, directive) || directive.kind != DirectiveKind::Insertion) {
            result.set_error(PatchErrorKind::Format,
                             fmt::format("Invalid Line {}: create mode requires every content line to be an "
                                         "addition: {}",
                                         parser.index, line));
            return false;
        }

        output.push_back(std::move(directive.text));
    }

    out_lines = std::move(output);
    result.chunk_count = out_lines.empty() ? 0 : 1;
    return true;
}

bool
patchy::apply_diff(const std::string& original,
                   const std::string& diff,
                   PatchMode mode,
                   std::string& out_text,
                   PatchResult& result,
                   const MatchOptions& options) {
    result = PatchResult{};

    const auto diff_lines = split_lines(diff);
    std::vector<std::string> patched;

    switch (mode) {
        case PatchMode::Create: {
            if (!parse_create_diff(diff_lines, patched, result)) {
                return false;
            }
        } break;
        case PatchMode::Update: {
            const auto lines = split_lines(original);

            std::vector<Chunk> chunks;
            if (!resolve_chunks(diff_lines, lines, options, chunks, result)) {
                return false;
            }
            if (!apply_chunks(lines, chunks, patched, result)) {
                return false;
            }
        } break;
    }

    out_text = join_lines(patched);
    return true;
}

bool
patchy::apply_diff(const std::string& original, const std::string& diff, std::string& out_text, PatchResult& result) {
    return apply_diff(original, diff, PatchMode::Update, out_text, result);
}
