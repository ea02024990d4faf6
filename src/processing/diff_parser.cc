#include "diff_parser.hpp"

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

bool
starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool
starts_with_any(const std::string& s, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (starts_with(s, prefix)) {
            return true;
        }
    }
    return false;
}

enum class SectionPhase {
    Leading,
    Edits,
    Trailing,
};

}  // namespace

bool
patchy::classify_directive(const std::string& line, Directive& directive) {
    if (line.empty()) {
        directive = {DirectiveKind::Context, ""};
        return true;
    }

    switch (line[0]) {
        case ' ':
            directive.kind = DirectiveKind::Context;
            break;
        case '-':
            directive.kind = DirectiveKind::Deletion;
            break;
        case '+':
            directive.kind = DirectiveKind::Insertion;
            break;
        default:
            return false;
    }

    directive.text = line.substr(1);
    return true;
}

bool
patchy::is_done(const ParserState& state, const std::vector<std::string>& terminators) {
    if (state.index >= state.lines.size()) {
        return true;
    }
    return starts_with_any(state.lines[state.index], terminators);
}

bool
patchy::read_str(ParserState& state, const std::string& prefix, std::string& remainder) {
    if (state.index >= state.lines.size()) {
        return false;
    }

    const auto& line = state.lines[state.index];
    if (!starts_with(line, prefix)) {
        return false;
    }

    remainder = line.substr(prefix.size());
    state.index++;
    return true;
}

std::vector<std::string>
patchy::Section::expected_lines() const {
    std::vector<std::string> expected;
    expected.reserve(leading_context.size() + delete_lines.size() + trailing_context.size());
    expected.insert(expected.end(), leading_context.begin(), leading_context.end());
    expected.insert(expected.end(), delete_lines.begin(), delete_lines.end());
    expected.insert(expected.end(), trailing_context.begin(), trailing_context.end());
    return expected;
}

bool
patchy::read_section(const std::vector<std::string>& lines,
                     std::size_t start_index,
                     Section& section,
                     PatchResult& result) {
    section = Section{};

    SectionPhase phase = SectionPhase::Leading;
    std::size_t trailing_start = start_index;
    std::size_t i = start_index;

    while (i < lines.size()) {
        const std::string& line = lines[i];

        if (starts_with_any(line, kSectionTerminators)) {
            break;
        }

        Directive directive;
        if (starts_with(line, "***") || !classify_directive(line, directive)) {
            result.set_error(PatchErrorKind::Format, fmt::format("Invalid Line {}: {}", i + 1, line));
            return false;
        }

        if (directive.kind == DirectiveKind::Context) {
            if (phase == SectionPhase::Leading) {
                section.leading_context.push_back(std::move(directive.text));
            } else {
                if (phase == SectionPhase::Edits) {
                    phase = SectionPhase::Trailing;
                    trailing_start = i;
                }
                section.trailing_context.push_back(std::move(directive.text));
            }
        } else {
            // An edit after trailing context starts the next section.
            if (phase == SectionPhase::Trailing) {
                section.continued = true;
                break;
            }
            phase = SectionPhase::Edits;
            if (directive.kind == DirectiveKind::Deletion) {
                section.delete_lines.push_back(std::move(directive.text));
            } else {
                section.insert_lines.push_back(std::move(directive.text));
            }
        }

        i++;
    }

    if (section.continued) {
        section.end_index = trailing_start;
        TRACE("read_section: [{}, {}) continued, -{} +{}\n", start_index, i, section.delete_lines.size(),
              section.insert_lines.size());
        return true;
    }

    const bool consumed = i > start_index;

    if (i < lines.size() && starts_with(lines[i], kEndOfFileMarker)) {
        section.eof = true;
        i++;
    }

    if (!consumed && !section.eof) {
        result.set_error(PatchErrorKind::Format,
                         fmt::format("Invalid Line {}: a section must contain at least one directive line",
                                     start_index + 1));
        return false;
    }

    section.end_index = i;
    TRACE("read_section: [{}, {}) eof={}, -{} +{}\n", start_index, i, section.eof, section.delete_lines.size(),
          section.insert_lines.size());
    return true;
}
