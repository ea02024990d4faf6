#include "config/config.hpp"
#include "processing/apply_diff.hpp"
#include "processing/patch_result.hpp"
#include "util/lines.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

#ifndef PATCHY_VERSION
#define PATCHY_VERSION "unknown"
#endif

#ifndef PATCHY_BUILD_HASH
#define PATCHY_BUILD_HASH "unknown"
#endif

namespace patchy {

enum class FileStatus {
    kOk,
    kStdin,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path) {
    if (path == "-") {
        return FileStatus::kStdin;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_symlink(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kStdin:
            return "Standard input";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        default:
            return "Unknown error";
    }
}

}  // namespace patchy

int
main(int argc, char* argv[]) {
    patchy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] target_file diff_file

Apply a context anchored diff to a file. Use '-' as diff_file to read the
diff from standard input. The result goes to standard output unless -o or
-i is given.

Options:
    -h, --help                   show this help and exit
    -v, --version                show program version and exit
    -m, --mode [mode]            update (default) or create
    -c, --create                 same as --mode create; the diff may only add lines
    -o, --output [file]          write the result to a file
    -i, --in-place               overwrite target_file with the result

    -w, --collapse-whitespace    match context that only differs in inner whitespace
    -W, --no-collapse-whitespace inverse of --collapse-whitespace
    -E, --no-eof-fallback        do not anchor end-of-file hunks at the end of the text
    -f, --max-fuzz [n]           reject patches needing more than n fuzz
    -V, --verbose                report how the patch was applied
)",
                                       argv[0]);

        help += "\n";

        help += "Config directory:\n    " + patchy::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"mode", required_argument, 0, 'm'},
                                               {"create", no_argument, 0, 'c'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"collapse-whitespace", no_argument, 0, 'w'},
                                               {"no-collapse-whitespace", no_argument, 0, 'W'},
                                               {"no-eof-fallback", no_argument, 0, 'E'},
                                               {"max-fuzz", required_argument, 0, 'f'},
                                               {"verbose", no_argument, 0, 'V'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvm:co:iwWEf:V", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", PATCHY_VERSION);
                    fmt::print("vcs hash: {}\n", PATCHY_BUILD_HASH);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 'm':
                    if (!patchy::patch_mode_from_string(optarg, opts.mode)) {
                        show_help(fmt::format("error: invalid mode ({})\n", optarg));
                        return false;
                    }
                    break;
                case 'c':
                    opts.mode = patchy::PatchMode::Create;
                    break;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'i':
                    opts.in_place = true;
                    break;
                case 'w':
                    opts.match.collapse_whitespace = true;
                    break;
                case 'W':
                    opts.match.collapse_whitespace = false;
                    break;
                case 'E':
                    opts.match.eof_fallback = false;
                    break;
                case 'f': {
                    if (isdigit(optarg[0]) || (optarg[0] == '-' && isdigit(optarg[1]))) {
                        opts.max_fuzz = atoll(optarg);
                    } else {
                        show_help(fmt::format("error: invalid value for -{} ({})\n", static_cast<char>(c), optarg));
                        return false;
                    }
                    break;
                }
                case 'V':
                    opts.verbose = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (opts.in_place && !opts.output_file.empty()) {
            show_help("error: -i and -o are mutually exclusive");
            return false;
        }

        int positional_count = in_argc - optind;

        if (positional_count != 2) {
            show_help("error: missing positional arguments");
            return false;
        }

        opts.target_file = in_argv[optind];
        opts.diff_file = in_argv[optind + 1];

        if (opts.target_file == "-") {
            show_help("error: target_file cannot be standard input");
            return false;
        }

        // A file being created does not have to exist yet.
        auto target_status = patchy::check_file_status(opts.target_file);
        auto diff_status = patchy::check_file_status(opts.diff_file);

        auto target_valid = target_status == patchy::FileStatus::kOk ||
                            (opts.mode == patchy::PatchMode::Create &&
                             target_status == patchy::FileStatus::kFileDoesNotExist);
        auto diff_valid = diff_status == patchy::FileStatus::kOk || diff_status == patchy::FileStatus::kStdin;
        if (!target_valid || !diff_valid) {
            std::string err;
            if (!target_valid)
                err += fmt::format("Target '{}': {}\n", opts.target_file, patchy::to_string(target_status));
            if (!diff_valid)
                err += fmt::format("Diff '{}': {}\n", opts.diff_file, patchy::to_string(diff_status));
            show_help(err);
            return false;
        }

        return true;
    };

    // Load the global defaults before we override them with command line args
    patchy::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return -1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    std::string diff_text;
    if (!patchy::read_file(opts.diff_file, diff_text)) {
        return 1;
    }

    // Create mode never looks at the current content.
    std::string original_text;
    if (opts.mode == patchy::PatchMode::Update && !patchy::read_file(opts.target_file, original_text)) {
        return 1;
    }

    std::string patched_text;
    patchy::PatchResult result;
    if (!patchy::apply_diff(original_text, diff_text, opts.mode, patched_text, result, opts.match)) {
        fmt::print(stderr, "error: patch rejected ({} error)\n{}\n", patchy::repr(result.kind), result.error);
        return 1;
    }

    if (opts.max_fuzz >= 0 && result.fuzz > opts.max_fuzz) {
        fmt::print(stderr, "error: patch rejected, fuzz {} exceeds the limit of {}\n", result.fuzz, opts.max_fuzz);
        return 1;
    }

    if (opts.verbose) {
        fmt::print(stderr, "{}: {} mode, {} chunk(s), fuzz {}\n", opts.target_file, patchy::repr(opts.mode),
                   result.chunk_count, result.fuzz);
    }

    if (opts.in_place) {
        return patchy::write_file(opts.target_file, patched_text) ? 0 : 1;
    } else if (!opts.output_file.empty()) {
        return patchy::write_file(opts.output_file, patched_text) ? 0 : 1;
    }

    if (fwrite(patched_text.data(), 1, patched_text.size(), stdout) != patched_text.size()) {
        fmt::print(stderr, "error: failed to write to standard output\n");
        return 1;
    }

    return 0;
}
