#include "lines.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

std::vector<std::string>
patchy::split_lines(const std::string& text) {
    std::vector<std::string> lines;

    if (text.empty()) {
        return lines;
    }

    std::string::size_type start = 0;
    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    // "a\n" splits into {"a", ""}; the empty tail is the newline itself.
    if (text.back() == '\n') {
        lines.pop_back();
    }

    return lines;
}

std::string
patchy::join_lines(gsl::span<const std::string> lines) {
    std::string text;

    if (lines.empty()) {
        return text;
    }

    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            text.push_back('\n');
        }
        text.append(lines[i]);
    }

    if (text.empty() || text.back() != '\n') {
        text.push_back('\n');
    }

    return text;
}

bool
patchy::read_file(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = path == "-" ? stdin : fopen(path.c_str(), "rb");
    if (!stream) {
        fmt::print(stderr, "Failed to open file '{}': {}\n", path, strerror(errno));
        return false;
    }

    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, n);
    }

    bool ok = ferror(stream) == 0;
    if (!ok) {
        fmt::print(stderr, "Failed to read file '{}'\n", path);
    }

    if (stream != stdin) {
        fclose(stream);
    }
    return ok;
}

bool
patchy::write_file(const std::string& path, const std::string& contents) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        fmt::print(stderr, "Failed to open '{}' for writing: {}\n", path, strerror(errno));
        return false;
    }

    bool ok = fwrite(contents.data(), 1, contents.size(), stream) == contents.size();
    if (fclose(stream) != 0) {
        ok = false;
    }

    if (!ok) {
        fmt::print(stderr, "Failed to write file '{}'\n", path);
    }
    return ok;
}
