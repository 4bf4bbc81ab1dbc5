#pragma once

#include <system_error>

namespace mbdb::format {

// ── Structural decode failures ────────────────────────────────────────────────
//
// Only structural problems are reported. Any bytes decode to *some* value, so
// an implausible mode or timestamp is never an error.

enum class DecodeErrc {
    invalid_signature = 1,   // first 4 bytes are not "mbdb"
    truncated_input   = 2,   // a read would run past the end of the buffer
};

// Category named "mbdb"; messages are suitable for direct display.
[[nodiscard]] const std::error_category& decode_category() noexcept;

[[nodiscard]] std::error_code make_error_code(DecodeErrc e) noexcept;

} // namespace mbdb::format

namespace std {
template <>
struct is_error_code_enum<mbdb::format::DecodeErrc> : true_type {};
} // namespace std
