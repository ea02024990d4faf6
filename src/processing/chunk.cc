#include "chunk.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchy;

namespace {

std::string
format_context(const std::vector<std::string>& context) {
    std::string text;
    for (const auto& line : context) {
        text += fmt::format("\n    {}", line);
    }
    return text;
}

bool
is_blank(const std::string& s) {
    return trim_whitespace(s).empty();
}

}  // namespace

bool
patchy::resolve_chunks(const std::vector<std::string>& diff_lines,
                       gsl::span<const std::string> lines,
                       const MatchOptions& options,
                       std::vector<Chunk>& chunks,
                       PatchResult& result) {
    chunks.clear();

    ParserState parser{diff_lines};
    int64_t cursor = 0;
    int hunk_number = 0;
    bool first_section = true;
    bool continued = false;

    while (!is_done(parser, kPatchTerminators)) {
        std::string hint;
        bool has_marker = read_str(parser, kHunkMarker, hint);

        // Only the very first section may float without a marker.
        if (!has_marker && !first_section && !continued) {
            result.set_error(PatchErrorKind::Format,
                             fmt::format("Invalid Line {}: expected '{}' but got: {}", parser.index + 1,
                                         kHunkMarker, parser.lines[parser.index]));
            return false;
        }

        if (has_marker || first_section) {
            hunk_number++;
        }

        Section section;
        if (!read_section(parser.lines, parser.index, section, result)) {
            return false;
        }

        if (has_marker && !hint.empty() && hint[0] == ' ') {
            hint.erase(0, 1);
        }
        if (has_marker && !is_blank(hint)) {
            section.leading_context.insert(section.leading_context.begin(), hint);
        }

        const auto expected = section.expected_lines();
        auto match = find_context(lines, expected, cursor, section.eof, options);
        if (!match.found()) {
            result.set_error(PatchErrorKind::Resolution,
                             fmt::format("Invalid {}Context in hunk {} (diff line {}):{}",
                                         section.eof ? "EOF " : "", hunk_number, parser.index + 1,
                                         format_context(expected)));
            return false;
        }

        const int64_t origin_index = match.index + static_cast<int64_t>(section.leading_context.size());
        TRACE("hunk {}: matched at {} with fuzz {}, origin {}\n", hunk_number, match.index, match.fuzz,
              origin_index);

        parser.fuzz += match.fuzz;
        cursor = origin_index + static_cast<int64_t>(section.delete_lines.size());

        if (section.has_edits()) {
            chunks.push_back({origin_index, std::move(section.delete_lines), std::move(section.insert_lines)});
        }

        parser.index = section.end_index;
        continued = section.continued;
        first_section = false;
    }

    result.fuzz = parser.fuzz;
    return true;
}

bool
patchy::apply_chunks(gsl::span<const std::string> lines,
                     const std::vector<Chunk>& chunks,
                     std::vector<std::string>& out_lines,
                     PatchResult& result) {
    const auto line_count = static_cast<int64_t>(lines.size());

    std::vector<std::string> output;
    output.reserve(lines.size());

    int64_t orig_index = 0;
    for (std::size_t i = 0; i < chunks.size(); i++) {
        const auto& chunk = chunks[i];
        const auto delete_count = static_cast<int64_t>(chunk.delete_lines.size());

        if (chunk.origin_index < 0 || chunk.origin_index + delete_count > line_count) {
            result.set_error(PatchErrorKind::Resolution,
                             fmt::format("Chunk {} is out of bounds: {} line(s) at {} in a text of {} line(s)",
                                         i + 1, delete_count, chunk.origin_index, line_count));
            return false;
        }

        if (chunk.origin_index < orig_index) {
            result.set_error(PatchErrorKind::Resolution,
                             fmt::format("Chunk {} at line {} overlaps the previous chunk ending at line {}",
                                         i + 1, chunk.origin_index, orig_index));
            return false;
        }

        for (auto j = orig_index; j < chunk.origin_index; j++) {
            output.push_back(lines[j]);
        }
        output.insert(output.end(), chunk.insert_lines.begin(), chunk.insert_lines.end());

        orig_index = chunk.origin_index + delete_count;
    }

    for (auto j = orig_index; j < line_count; j++) {
        output.push_back(lines[j]);
    }

    out_lines = std::move(output);
    result.chunk_count = static_cast<int64_t>(chunks.size());
    return true;
}
