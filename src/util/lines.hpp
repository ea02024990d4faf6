#pragma once

#include <gsl/span>

#include <string>
#include <vector>

namespace patchy {

// Split text on '\n'. A single trailing newline is a property of the text,
// not an extra empty line, so "a\nb\n" and "a\nb" both yield {"a", "b"}.
std::vector<std::string>
split_lines(const std::string& text);

// Join lines with '\n' and make sure the result ends with exactly one
// newline. An explicit empty last line counts as that newline. An empty
// sequence joins to the empty string. A text ending in a blank line
// ("a\n\n") does not survive split_lines + join_lines: the blank line is lost.
std::string
join_lines(gsl::span<const std::string> lines);

bool
read_file(const std::string& path, std::string& contents);

bool
write_file(const std::string& path, const std::string& contents);

}  // namespace patchy
