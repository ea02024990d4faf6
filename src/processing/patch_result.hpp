#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace patchy {

// clang-format off
enum class PatchErrorKind {
    None,
    Format,     // The diff text itself is malformed
    Resolution, // The diff is well formed but does not apply to the text
};
// clang-format on

struct PatchResult {
    PatchErrorKind kind = PatchErrorKind::None;
    std::string error;

    // Accumulated match cost over all resolved sections.
    int64_t fuzz = 0;
    int64_t chunk_count = 0;

    bool
    is_ok() const {
        return kind == PatchErrorKind::None;
    }

    void
    set_error(PatchErrorKind error_kind, std::string error_message) {
        kind = error_kind;
        error = std::move(error_message);
    }
};

std::string
repr(PatchErrorKind kind);

}  // namespace patchy
