#pragma once

#include "processing/context_match.hpp"
#include "processing/diff_parser.hpp"
#include "processing/patch_result.hpp"

#include <gsl/span>

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

// A positioned edit: at 'origin_index' in the original lines, replace
// 'delete_lines' with 'insert_lines'.
struct Chunk {
    int64_t origin_index = 0;
    std::vector<std::string> delete_lines;
    std::vector<std::string> insert_lines;
};

// Parse an update diff and locate each of its sections in 'lines'. Chunks
// come out in text order and never overlap.
bool
resolve_chunks(const std::vector<std::string>& diff_lines,
               gsl::span<const std::string> lines,
               const MatchOptions& options,
               std::vector<Chunk>& chunks,
               PatchResult& result);

// Splice the chunks into 'lines'. Chunks that reach past the end of the
// text, or that start before the previous chunk ends, are rejected.
bool
apply_chunks(gsl::span<const std::string> lines,
             const std::vector<Chunk>& chunks,
             std::vector<std::string>& out_lines,
             PatchResult& result);

}  // namespace patchy
